#pragma once

#include "analysis/block.hpp"
#include <string>
#include <vector>
#include <functional>

namespace ds {

/**
 * @brief One row of the category decision table
 *
 * The predicate receives the block and the document's body font size.
 */
struct CategoryRule {
    std::string name;
    std::function<bool(const Block&, double)> matches;
    std::string outcome;
};

/**
 * @brief Rule-based semantic classifier
 *
 * All size thresholds are ratios of the body font size: the font size with
 * the most characters among non-bold body-region blocks. Rules run in a
 * fixed priority order; the first match wins and "body" is the fallback,
 * so every block gets exactly one type.
 */
class CategoryClassifier {
public:
    static constexpr double kDefaultBodyFontSize = 10.0;

    CategoryClassifier();

    /**
     * @brief Dominant non-bold body font size, or kDefaultBodyFontSize
     *
     * Ties go to the size encountered first.
     */
    static double compute_body_font_size(const std::vector<Block>& blocks);

    std::string classify(const Block& block, double body_font_size) const;

    /**
     * @brief Classify every block against one shared baseline
     */
    std::vector<std::string> classify_all(const std::vector<Block>& blocks,
                                          double body_font_size) const;

    /**
     * @brief Name of the rule that decides a block, or "default"
     */
    std::string matching_rule(const Block& block, double body_font_size) const;

    const std::vector<CategoryRule>& get_rules() const { return rules_; }

private:
    std::vector<CategoryRule> rules_;
};

} // namespace ds
