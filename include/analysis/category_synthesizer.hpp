#pragma once

#include "analysis/block.hpp"
#include <string>
#include <vector>
#include <utility>

namespace ds {

/**
 * @brief Builds the category map from classified blocks
 *
 * Blocks are grouped by category type only. The map is rebuilt from
 * scratch on every call, so aggregates always match the current members.
 */
class CategorySynthesizer {
public:
    CategorySynthesizer() = default;

    /**
     * @brief Group blocks by type and back-fill their category ids
     *
     * @param blocks Blocks to categorize; category_id is overwritten
     * @param types Category type of each block, parallel to blocks
     * @return Categories keyed by id
     * @throws std::invalid_argument if the two vectors differ in length
     */
    CategoryMap synthesize(std::vector<Block>& blocks,
                           const std::vector<std::string>& types) const;

    /**
     * @brief Content-addressed category id for a type name
     */
    static std::string category_id_for(const std::string& type);

    static bool is_known_type(const std::string& type);

    /**
     * @brief Semantic color of a known type, empty for unknown types
     */
    static std::string semantic_color(const std::string& type);

    static const std::vector<std::string>& fallback_palette();

    /**
     * @brief Display name and description for a type with the given size
     */
    static std::pair<std::string, std::string> describe(const std::string& type,
                                                        int block_count);
};

} // namespace ds
