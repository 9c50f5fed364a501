#pragma once

#include <string>
#include <cstddef>

namespace ds {

// ============================================================================
// Text Utilities
// ============================================================================

/**
 * @brief Number of Unicode code points in a UTF-8 string
 */
size_t utf8_length(const std::string& text);

/**
 * @brief First max_chars code points of a UTF-8 string
 */
std::string utf8_prefix(const std::string& text, size_t max_chars);

/**
 * @brief True if text is empty or contains only whitespace
 *
 * Whitespace covers ASCII spaces and controls plus the Unicode space
 * separators (no-break space, ideographic space, line separators).
 */
bool is_blank(const std::string& text);

/**
 * @brief Trim leading and trailing whitespace as defined by is_blank
 */
std::string trim(const std::string& text);

/**
 * @brief ASCII lower-case copy
 */
std::string to_lower(const std::string& text);

/**
 * @brief Case-insensitive ASCII substring test
 */
bool contains_ci(const std::string& haystack, const std::string& needle);

/**
 * @brief Round to one decimal place
 */
double round1(double value);

/**
 * @brief Derive a display name from a path (file name with extension)
 */
std::string file_name_of(const std::string& path);

} // namespace ds
