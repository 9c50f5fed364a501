#include "analysis/region_classifier.hpp"

namespace ds {

RegionClassifier::RegionClassifier() {
    rules_ = {
        {"top_short_header",
         [](const RegionInput& in) {
             return in.y_pct < 0.05 && in.text_length < 150 && in.line_count <= 3;
         },
         Region::HEADER},
        {"top_brief_header",
         [](const RegionInput& in) {
             return in.y_pct < 0.08 && in.text_length < 80 && in.line_count <= 2;
         },
         Region::HEADER},
        {"bottom_footer",
         [](const RegionInput& in) {
             return in.y_pct > 0.92 || (in.y_pct > 0.88 && in.text_length < 50);
         },
         Region::FOOTER},
        {"lower_page",
         [](const RegionInput& in) { return in.y_pct > 0.70; },
         Region::LOWER},
    };
}

RegionInput RegionClassifier::make_input(const Block& block, double page_height) {
    RegionInput input;
    input.y_pct = page_height > 0.0 ? block.y / page_height : 0.5;
    input.text_length = block.char_count;
    input.line_count = block.line_count;
    return input;
}

Region RegionClassifier::classify(const Block& block, double page_height) const {
    if (page_height <= 0.0) {
        return Region::BODY;
    }
    return classify(make_input(block, page_height));
}

Region RegionClassifier::classify(const RegionInput& input) const {
    for (const auto& rule : rules_) {
        if (rule.matches(input)) {
            return rule.outcome;
        }
    }
    return Region::BODY;
}

std::string RegionClassifier::matching_rule(const RegionInput& input) const {
    for (const auto& rule : rules_) {
        if (rule.matches(input)) {
            return rule.name;
        }
    }
    return "default";
}

} // namespace ds
