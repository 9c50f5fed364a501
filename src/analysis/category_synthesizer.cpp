#include "analysis/category_synthesizer.hpp"
#include "util/hash.hpp"
#include "util/text.hpp"
#include <algorithm>
#include <map>
#include <stdexcept>
#include <tuple>

namespace {

constexpr size_t kCategoryIdLength = 8;
constexpr size_t kSampleLength = 100;

const std::map<std::string, std::string>& type_colors() {
    static const std::map<std::string, std::string> colors = {
        {"body", "#4CAF50"},
        {"footnote", "#2196F3"},
        {"footnote_ref", "#E91E63"},
        {"heading", "#FF9800"},
        {"subheading", "#9C27B0"},
        {"title", "#F44336"},
        {"caption", "#00BCD4"},
        {"quote", "#FFEB3B"},
        {"header", "#795548"},
        {"footer", "#607D8B"},
        {"image", "#9E9E9E"},
    };
    return colors;
}

struct Group {
    std::string type;
    std::vector<size_t> members;
    long total_chars = 0;
};

}  // namespace

namespace ds {

std::string CategorySynthesizer::category_id_for(const std::string& type) {
    return short_hash(type, kCategoryIdLength);
}

bool CategorySynthesizer::is_known_type(const std::string& type) {
    return type_colors().count(type) > 0;
}

std::string CategorySynthesizer::semantic_color(const std::string& type) {
    auto it = type_colors().find(type);
    return it != type_colors().end() ? it->second : "";
}

const std::vector<std::string>& CategorySynthesizer::fallback_palette() {
    static const std::vector<std::string> palette = {
        "#E91E63", "#3F51B5", "#009688", "#8BC34A", "#FF5722",
        "#673AB7", "#00E676", "#FF4081", "#536DFE",
    };
    return palette;
}

std::pair<std::string, std::string> CategorySynthesizer::describe(const std::string& type,
                                                                  int block_count) {
    std::string n = std::to_string(block_count);
    if (type == "body") return {"Body Text", "Main content (" + n + " blocks)"};
    if (type == "footnote") return {"Footnotes", "Footnotes and references (" + n + " blocks)"};
    if (type == "footnote_ref") return {"Footnote Numbers", "Superscript reference numbers (" + n + " blocks)"};
    if (type == "heading") return {"Section Headings", "Bold section titles"};
    if (type == "subheading") return {"Subheadings", "Bold subsection titles"};
    if (type == "title") return {"Titles", "Large titles or chapter headings"};
    if (type == "header") return {"Page Headers", "Running header text"};
    if (type == "footer") return {"Page Footers", "Page numbers or footer text"};
    if (type == "caption") return {"Captions", "Figure or table captions"};
    if (type == "quote") return {"Block Quotes", "Indented quotations"};
    if (type == "image") return {"Images", "Figures and images (" + n + " blocks)"};
    return {"Other (" + type + ")", "Other text style"};
}

CategoryMap CategorySynthesizer::synthesize(std::vector<Block>& blocks,
                                            const std::vector<std::string>& types) const {
    if (blocks.size() != types.size()) {
        throw std::invalid_argument("Block and type counts differ");
    }

    std::vector<Group> groups;
    std::map<std::string, size_t> group_index;
    for (size_t i = 0; i < blocks.size(); ++i) {
        auto it = group_index.find(types[i]);
        if (it == group_index.end()) {
            it = group_index.emplace(types[i], groups.size()).first;
            groups.push_back(Group{types[i], {}, 0});
        }
        Group& group = groups[it->second];
        group.members.push_back(i);
        group.total_chars += blocks[i].char_count;
    }

    // Largest groups first; equal totals are ordered by type name so the
    // fallback colors do not depend on discovery order.
    std::sort(groups.begin(), groups.end(), [](const Group& a, const Group& b) {
        if (a.total_chars != b.total_chars) return a.total_chars > b.total_chars;
        return a.type < b.type;
    });

    CategoryMap categories;
    const auto& palette = fallback_palette();
    size_t fallback_index = 0;

    for (const auto& group : groups) {
        const Block& first = blocks[group.members.front()];

        double size_sum = 0.0;
        for (size_t idx : group.members) {
            size_sum += blocks[idx].font_size;
        }

        Category category;
        category.id = category_id_for(group.type);
        category.type = group.type;
        std::tie(category.name, category.description) =
            describe(group.type, static_cast<int>(group.members.size()));

        category.color = semantic_color(group.type);
        if (category.color.empty()) {
            category.color = palette[fallback_index % palette.size()];
            fallback_index++;
        }

        category.block_count = static_cast<int>(group.members.size());
        category.char_count = static_cast<int>(group.total_chars);
        category.font_size = round1(size_sum / group.members.size());
        category.region = first.region;
        category.sample_text = utf8_prefix(first.text, kSampleLength);
        category.enabled = true;

        for (size_t idx : group.members) {
            blocks[idx].category_id = category.id;
        }
        categories[category.id] = std::move(category);
    }

    return categories;
}

} // namespace ds
