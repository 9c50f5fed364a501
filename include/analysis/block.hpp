#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <map>

namespace ds {

// Coarse vertical page region of a block
enum class Region {
    HEADER,
    FOOTER,
    LOWER,
    BODY
};

inline std::string region_to_string(Region region) {
    switch (region) {
        case Region::HEADER: return "header";
        case Region::FOOTER: return "footer";
        case Region::LOWER: return "lower";
        case Region::BODY: return "body";
        default: return "body";
    }
}

inline Region string_to_region(const std::string& s) {
    if (s == "header") return Region::HEADER;
    if (s == "footer") return Region::FOOTER;
    if (s == "lower") return Region::LOWER;
    return Region::BODY;
}

// Known category types
namespace category_type {
constexpr const char* BODY = "body";
constexpr const char* FOOTNOTE = "footnote";
constexpr const char* FOOTNOTE_REF = "footnote_ref";
constexpr const char* HEADING = "heading";
constexpr const char* SUBHEADING = "subheading";
constexpr const char* TITLE = "title";
constexpr const char* HEADER = "header";
constexpr const char* FOOTER = "footer";
constexpr const char* CAPTION = "caption";
constexpr const char* QUOTE = "quote";
constexpr const char* IMAGE = "image";
}  // namespace category_type

/**
 * @brief One visually coherent unit of content on one page
 *
 * Geometry is in top-left-origin page units; page is 0-indexed.
 */
struct Block {
    std::string id;
    int page = 0;
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
    std::string text;
    double font_size = 0.0;
    std::string font_name;
    int char_count = 0;
    Region region = Region::BODY;
    std::string category_id;       ///< Empty until categorization
    bool is_bold = false;
    bool is_italic = false;
    bool is_superscript = false;
    bool is_image = false;
    int line_count = 1;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["id"] = id;
        j["page"] = page;
        j["x"] = x;
        j["y"] = y;
        j["width"] = width;
        j["height"] = height;
        j["text"] = text;
        j["font_size"] = font_size;
        j["font_name"] = font_name;
        j["char_count"] = char_count;
        j["region"] = region_to_string(region);
        j["category_id"] = category_id;
        j["is_bold"] = is_bold;
        j["is_italic"] = is_italic;
        j["is_superscript"] = is_superscript;
        j["is_image"] = is_image;
        j["line_count"] = line_count;
        return j;
    }

    static Block from_json(const nlohmann::json& j) {
        Block b;
        b.id = j.value("id", "");
        b.page = j.value("page", 0);
        b.x = j.value("x", 0.0);
        b.y = j.value("y", 0.0);
        b.width = j.value("width", 0.0);
        b.height = j.value("height", 0.0);
        b.text = j.value("text", "");
        b.font_size = j.value("font_size", 0.0);
        b.font_name = j.value("font_name", "");
        b.char_count = j.value("char_count", 0);
        b.region = string_to_region(j.value("region", "body"));
        b.category_id = j.value("category_id", "");
        b.is_bold = j.value("is_bold", false);
        b.is_italic = j.value("is_italic", false);
        b.is_superscript = j.value("is_superscript", false);
        b.is_image = j.value("is_image", false);
        b.line_count = j.value("line_count", 1);
        return b;
    }
};

/**
 * @brief A named, colored group of blocks sharing a semantic type
 */
struct Category {
    std::string id;
    std::string type;
    std::string name;
    std::string description;
    std::string color;
    int block_count = 0;
    int char_count = 0;
    double font_size = 0.0;        ///< Mean over members, one decimal
    Region region = Region::BODY;  ///< Region of the first member
    std::string sample_text;
    bool enabled = true;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["id"] = id;
        j["type"] = type;
        j["name"] = name;
        j["description"] = description;
        j["color"] = color;
        j["block_count"] = block_count;
        j["char_count"] = char_count;
        j["font_size"] = font_size;
        j["region"] = region_to_string(region);
        j["sample_text"] = sample_text;
        j["enabled"] = enabled;
        return j;
    }
};

// Categories keyed by id
using CategoryMap = std::map<std::string, Category>;

} // namespace ds
