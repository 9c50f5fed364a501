#include "analysis/block_extractor.hpp"
#include "util/hash.hpp"
#include "util/text.hpp"
#include <cmath>
#include <cstdio>
#include <iostream>
#include <utility>

namespace {

constexpr size_t kBlockIdLength = 12;
constexpr size_t kIdTextPrefix = 50;

// Same formatting as "%.0f" so ids survive a round trip through text
std::string format_coord(double value) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.0f", value);
    return buf;
}

// Character-weighted tally that remembers insertion order for tie-breaks
template<typename Key>
class WeightedTally {
public:
    void add(const Key& key, long weight) {
        for (auto& entry : entries_) {
            if (entry.first == key) {
                entry.second += weight;
                return;
            }
        }
        entries_.emplace_back(key, weight);
    }

    bool empty() const { return entries_.empty(); }

    const Key& dominant() const {
        const std::pair<Key, long>* best = &entries_.front();
        for (const auto& entry : entries_) {
            if (entry.second > best->second) {
                best = &entry;
            }
        }
        return best->first;
    }

private:
    std::vector<std::pair<Key, long>> entries_;
};

}  // namespace

namespace ds {

BlockExtractor::BlockExtractor(double min_image_size)
    : min_image_size_(min_image_size) {}

BlockExtractor::BoxKey BlockExtractor::box_key(const Rect& box) {
    return BoxKey{std::lround(box.x0), std::lround(box.y0),
                  std::lround(box.x1), std::lround(box.y1)};
}

bool BlockExtractor::accept_image(const Rect& box, std::set<BoxKey>& seen) const {
    // Decorative glyphs and rules
    if (box.width() < min_image_size_ || box.height() < min_image_size_) {
        return false;
    }
    return seen.insert(box_key(box)).second;
}

Block BlockExtractor::make_image_block(int page, const Rect& box, const std::string& id_key) {
    Block block;
    block.id = short_hash(id_key, kBlockIdLength);
    block.page = page;
    block.x = box.x0;
    block.y = box.y0;
    block.width = box.width();
    block.height = box.height();
    block.text = "[Image " + std::to_string(static_cast<int>(block.width)) + "x" +
                 std::to_string(static_cast<int>(block.height)) + "]";
    block.font_size = 0.0;
    block.font_name = "image";
    block.char_count = 0;
    block.region = Region::BODY;
    block.is_image = true;
    block.line_count = 0;
    return block;
}

bool BlockExtractor::merge_text_block(int page, int layout_index, const LayoutBlock& layout,
                                      Block& out) {
    std::string combined;
    WeightedTally<double> font_sizes;
    WeightedTally<std::string> font_names;
    long bold_chars = 0;
    long italic_chars = 0;
    long superscript_chars = 0;
    long total_chars = 0;

    for (const auto& line : layout.lines) {
        for (const auto& span : line.spans) {
            if (is_blank(span.text)) {
                continue;
            }
            if (!combined.empty()) {
                combined += ' ';
            }
            combined += span.text;

            long chars = static_cast<long>(utf8_length(span.text));
            total_chars += chars;
            font_sizes.add(round1(span.font_size), chars);
            std::string font = span.font_name.empty() ? "unknown" : span.font_name;
            font_names.add(font, chars);

            // Font names and engine flags are both unreliable alone
            if (contains_ci(font, "bold") || (span.flags & kSpanBold)) {
                bold_chars += chars;
            }
            if (contains_ci(font, "italic") || contains_ci(font, "oblique") ||
                (span.flags & kSpanItalic)) {
                italic_chars += chars;
            }
            if (span.flags & kSpanSuperscript) {
                superscript_chars += chars;
            }
        }
    }

    if (is_blank(combined)) {
        return false;
    }

    out = Block();
    out.id = short_hash(std::to_string(page) + ":" + std::to_string(layout_index) + ":" +
                        utf8_prefix(combined, kIdTextPrefix), kBlockIdLength);
    out.page = page;
    out.x = layout.bbox.x0;
    out.y = layout.bbox.y0;
    out.width = layout.bbox.width();
    out.height = layout.bbox.height();
    out.char_count = static_cast<int>(utf8_length(combined));
    out.text = std::move(combined);
    out.font_size = font_sizes.empty() ? 10.0 : font_sizes.dominant();
    out.font_name = font_names.empty() ? "unknown" : font_names.dominant();
    out.is_bold = total_chars > 0 && bold_chars > total_chars * 0.5;
    out.is_italic = total_chars > 0 && italic_chars > total_chars * 0.5;
    out.is_superscript = total_chars > 0 && superscript_chars > total_chars * 0.5;
    out.is_image = false;
    out.line_count = static_cast<int>(layout.lines.size());
    return true;
}

std::vector<Block> BlockExtractor::build_page_blocks(
    int page,
    const PageSize& size,
    const std::vector<Rect>& image_boxes,
    const std::vector<LayoutBlock>& layout
) const {
    std::vector<Block> blocks;
    std::set<BoxKey> seen_images;

    for (const auto& box : image_boxes) {
        if (!accept_image(box, seen_images)) {
            continue;
        }
        std::string key = std::to_string(page) + ":img:" +
                          format_coord(box.x0) + "," + format_coord(box.y0) + "," +
                          format_coord(box.x1) + "," + format_coord(box.y1);
        blocks.push_back(make_image_block(page, box, key));
    }

    for (size_t i = 0; i < layout.size(); ++i) {
        const LayoutBlock& fragment = layout[i];
        int layout_index = static_cast<int>(i);

        if (!fragment.is_text || fragment.lines.empty()) {
            if (!accept_image(fragment.bbox, seen_images)) {
                continue;
            }
            std::string key = std::to_string(page) + ":img:" + std::to_string(layout_index) +
                              ":" + format_coord(fragment.bbox.x0) + "," +
                              format_coord(fragment.bbox.y0);
            blocks.push_back(make_image_block(page, fragment.bbox, key));
            continue;
        }

        Block block;
        if (!merge_text_block(page, layout_index, fragment, block)) {
            continue;
        }
        block.region = region_classifier_.classify(block, size.height);
        blocks.push_back(std::move(block));
    }

    return blocks;
}

std::vector<Block> BlockExtractor::extract_page(Document& doc, int page, const PageSize& size) const {
    std::vector<Rect> image_boxes;
    try {
        image_boxes = doc.extract_image_boxes(page);
    } catch (const DocumentError& e) {
        // Images still arrive through the layout path
        std::cerr << "Image listing failed on page " << page << ": " << e.what() << std::endl;
    }
    std::vector<LayoutBlock> layout = doc.extract_fragments(page);
    return build_page_blocks(page, size, image_boxes, layout);
}

} // namespace ds
