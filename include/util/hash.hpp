#pragma once

#include <string>
#include <cstddef>

namespace ds {

/**
 * @brief Lower-case hex MD5 digest of a string, truncated to length chars
 *
 * Used for content-addressed block and category identifiers.
 */
std::string short_hash(const std::string& key, size_t length);

} // namespace ds
