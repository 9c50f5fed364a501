#pragma once

#include "analysis/block.hpp"
#include "analysis/region_classifier.hpp"
#include "engine/document.hpp"
#include <string>
#include <vector>
#include <set>
#include <tuple>

namespace ds {

/**
 * @brief Turns a page's raw fragments into normalized blocks
 *
 * Images come from two sources, the engine's image list and non-text
 * layout blocks; both feed one per-page dedup set keyed on rounded
 * coordinates. Each text layout block becomes one Block carrying its
 * character-weighted dominant font and emphasis.
 */
class BlockExtractor {
public:
    explicit BlockExtractor(double min_image_size = 20.0);

    /**
     * @brief Query the document and build the blocks of one page
     */
    std::vector<Block> extract_page(Document& doc, int page, const PageSize& size) const;

    /**
     * @brief Build the blocks of one page from already-extracted fragments
     */
    std::vector<Block> build_page_blocks(
        int page,
        const PageSize& size,
        const std::vector<Rect>& image_boxes,
        const std::vector<LayoutBlock>& layout
    ) const;

    /**
     * @brief Merge one text layout block
     *
     * @return false if the merged text is blank and the block is discarded
     */
    static bool merge_text_block(int page, int layout_index, const LayoutBlock& layout,
                                 Block& out);

    double get_min_image_size() const { return min_image_size_; }

private:
    using BoxKey = std::tuple<long, long, long, long>;

    double min_image_size_;
    RegionClassifier region_classifier_;

    bool accept_image(const Rect& box, std::set<BoxKey>& seen) const;

    static BoxKey box_key(const Rect& box);
    static Block make_image_block(int page, const Rect& box, const std::string& id_key);
};

} // namespace ds
