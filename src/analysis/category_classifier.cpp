#include "analysis/category_classifier.hpp"
#include <utility>

namespace ds {

CategoryClassifier::CategoryClassifier() {
    namespace ct = category_type;

    rules_ = {
        {"image",
         [](const Block& b, double) { return b.is_image; },
         ct::IMAGE},
        {"superscript",
         [](const Block& b, double) { return b.is_superscript; },
         ct::FOOTNOTE_REF},
        // Catches reference marks the engine did not flag as superscript.
        // Stray short fragments in a small font land here too.
        {"tiny_reference_mark",
         [](const Block& b, double base) {
             return b.font_size < base * 0.7 && b.char_count < 5;
         },
         ct::FOOTNOTE_REF},
        {"header_region",
         [](const Block& b, double) { return b.region == Region::HEADER; },
         ct::HEADER},
        {"footer_region",
         [](const Block& b, double) { return b.region == Region::FOOTER; },
         ct::FOOTER},
        {"lower_small_text",
         [](const Block& b, double base) {
             return b.region == Region::LOWER && b.font_size < base * 0.95;
         },
         ct::FOOTNOTE},
        {"small_text",
         [](const Block& b, double base) {
             return b.font_size < base * 0.85 && b.region != Region::LOWER;
         },
         ct::CAPTION},
        {"large_text",
         [](const Block& b, double base) { return b.font_size > base * 1.4; },
         ct::TITLE},
        {"bold_large",
         [](const Block& b, double base) {
             return b.is_bold && b.font_size > base * 1.1;
         },
         ct::HEADING},
        {"bold_short",
         [](const Block& b, double) {
             return b.is_bold && b.line_count <= 2 && b.char_count < 200;
         },
         ct::SUBHEADING},
        {"italic_multiline",
         [](const Block& b, double) { return b.is_italic && b.line_count > 2; },
         ct::QUOTE},
    };
}

double CategoryClassifier::compute_body_font_size(const std::vector<Block>& blocks) {
    // Insertion-ordered histogram so ties resolve to the first size seen
    std::vector<std::pair<double, long>> size_chars;

    for (const auto& block : blocks) {
        if (block.region != Region::BODY || block.is_bold) {
            continue;
        }
        bool found = false;
        for (auto& entry : size_chars) {
            if (entry.first == block.font_size) {
                entry.second += block.char_count;
                found = true;
                break;
            }
        }
        if (!found) {
            size_chars.emplace_back(block.font_size, block.char_count);
        }
    }

    if (size_chars.empty()) {
        return kDefaultBodyFontSize;
    }

    const std::pair<double, long>* best = &size_chars.front();
    for (const auto& entry : size_chars) {
        if (entry.second > best->second) {
            best = &entry;
        }
    }

    // A zero baseline would make every ratio test meaningless
    return best->first > 0.0 ? best->first : kDefaultBodyFontSize;
}

std::string CategoryClassifier::classify(const Block& block, double body_font_size) const {
    for (const auto& rule : rules_) {
        if (rule.matches(block, body_font_size)) {
            return rule.outcome;
        }
    }
    return category_type::BODY;
}

std::vector<std::string> CategoryClassifier::classify_all(const std::vector<Block>& blocks,
                                                          double body_font_size) const {
    std::vector<std::string> types;
    types.reserve(blocks.size());
    for (const auto& block : blocks) {
        types.push_back(classify(block, body_font_size));
    }
    return types;
}

std::string CategoryClassifier::matching_rule(const Block& block, double body_font_size) const {
    for (const auto& rule : rules_) {
        if (rule.matches(block, body_font_size)) {
            return rule.name;
        }
    }
    return "default";
}

} // namespace ds
