#pragma once

#include "analysis/block.hpp"
#include <string>
#include <vector>
#include <functional>

namespace ds {

/**
 * @brief Inputs the region rules look at
 */
struct RegionInput {
    double y_pct = 0.0;            ///< Block top divided by page height
    int text_length = 0;           ///< Characters of merged text
    int line_count = 0;
};

/**
 * @brief One row of the region decision table
 */
struct RegionRule {
    std::string name;
    std::function<bool(const RegionInput&)> matches;
    Region outcome;
};

/**
 * @brief Assigns header/footer/lower/body from vertical position
 *
 * Rules are evaluated in order and the first match wins; a block that
 * matches nothing is body. Short text near the top is a running header,
 * while long text there is the page's first paragraph.
 */
class RegionClassifier {
public:
    RegionClassifier();

    Region classify(const Block& block, double page_height) const;
    Region classify(const RegionInput& input) const;

    /**
     * @brief Name of the first matching rule, or "default"
     */
    std::string matching_rule(const RegionInput& input) const;

    const std::vector<RegionRule>& get_rules() const { return rules_; }

    static RegionInput make_input(const Block& block, double page_height);

private:
    std::vector<RegionRule> rules_;
};

} // namespace ds
