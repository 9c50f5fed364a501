#include "analysis/chapter_detector.hpp"
#include "util/hash.hpp"
#include "util/text.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <map>
#include <regex>

namespace {

const std::regex& chapter_word_pattern() {
    static const std::regex pattern(
        R"(^(chapter|part|book|section|introduction|preface|foreword|epilogue|prologue|acknowledgments?|afterword|appendix|contents?|table of contents?)\s*([\dIVXLCDMivxlcdm]+)?\.?$)",
        std::regex::icase);
    return pattern;
}

const std::regex& numbered_chapter_pattern() {
    static const std::regex pattern(
        R"(^(chapter|part|section)\s+[\dIVXLCDMivxlcdm]+\.?\s*[:\-]?\s*.+)",
        std::regex::icase);
    return pattern;
}

constexpr double kDefaultPageHeight = 800.0;

}  // namespace

namespace ds {

nlohmann::json Chapter::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["title"] = title;
    j["page"] = page;
    if (has_y) j["y"] = y;
    j["level"] = level;
    j["source"] = source;
    if (!block_id.empty()) j["blockId"] = block_id;
    if (source == "heuristic") j["confidence"] = confidence;
    return j;
}

bool ChapterDetector::matches_chapter_pattern(const std::string& text) {
    return std::regex_search(text, chapter_word_pattern()) ||
           std::regex_search(text, numbered_chapter_pattern());
}

int ChapterDetector::infer_level(const std::string& text, double font_size,
                                 double body_font_size) {
    static const std::regex part_pattern(R"(^(part|book)\s+[\dIVXLCDM]+)", std::regex::icase);
    static const std::regex chapter_pattern(R"(^chapter\s+[\dIVXLCDM]+)", std::regex::icase);
    static const std::regex section_pattern(R"(^section\s+[\dIVXLCDM]+)", std::regex::icase);

    if (std::regex_search(text, part_pattern)) return 1;
    if (std::regex_search(text, chapter_pattern) || font_size > body_font_size * 1.5) return 1;
    if (std::regex_search(text, section_pattern) || font_size > body_font_size * 1.2) return 2;
    return 3;
}

std::string ChapterDetector::clip_title(const std::string& title) {
    if (utf8_length(title) > 80) {
        return utf8_prefix(title, 77) + "...";
    }
    return title;
}

std::vector<Chapter> ChapterDetector::from_toc(const std::vector<TocEntry>& toc) {
    std::vector<Chapter> chapters;
    int counter = 0;
    for (const auto& entry : toc) {
        Chapter chapter;
        chapter.id = "toc-" + std::to_string(counter++);
        chapter.title = entry.title;
        chapter.page = entry.page > 0 ? entry.page - 1 : 0;
        chapter.level = entry.level;
        chapter.source = "toc";
        chapters.push_back(std::move(chapter));
    }
    return chapters;
}

std::vector<Chapter> ChapterDetector::detect(const AnalysisResult& result) const {
    std::vector<Chapter> candidates;
    if (result.blocks.empty()) {
        return candidates;
    }

    const double body_size = result.body_font_size;
    std::map<std::string, const Block*> by_id;

    for (const auto& block : result.blocks) {
        by_id[block.id] = &block;
        if (block.is_image || block.char_count < 3) continue;

        const std::string text = trim(block.text);
        double confidence = 0.0;

        auto cat = result.categories.find(block.category_id);
        if (cat != result.categories.end() && cat->second.type == category_type::TITLE) {
            confidence += 0.4;
        }
        if (block.font_size > body_size * 1.3) {
            confidence += 0.3;
        }
        if (matches_chapter_pattern(text)) {
            confidence += 0.5;
        }
        double page_height = kDefaultPageHeight;
        if (block.page >= 0 && block.page < static_cast<int>(result.page_dimensions.size()) &&
            result.page_dimensions[block.page].height > 0.0) {
            page_height = result.page_dimensions[block.page].height;
        }
        if (block.is_bold && block.y / page_height < 0.25) {
            confidence += 0.2;
        }
        if (block.line_count <= 2 && block.char_count < 100) {
            confidence += 0.1;
        }

        // Tolerate float accumulation just below the threshold
        if (confidence + 1e-9 < kMinConfidence) continue;

        char y_buf[32];
        std::snprintf(y_buf, sizeof(y_buf), "%g", block.y);

        Chapter chapter;
        chapter.id = short_hash("heuristic-" + std::to_string(block.page) + "-" + y_buf + "-" +
                                utf8_prefix(text, 20), 12);
        chapter.title = clip_title(text);
        chapter.page = block.page;
        chapter.y = block.y;
        chapter.has_y = true;
        chapter.block_id = block.id;
        chapter.level = infer_level(text, block.font_size, body_size);
        chapter.source = "heuristic";
        chapter.confidence = confidence;
        candidates.push_back(std::move(chapter));
    }

    std::stable_sort(candidates.begin(), candidates.end(), [](const Chapter& a, const Chapter& b) {
        if (a.page != b.page) return a.page < b.page;
        return a.y < b.y;
    });

    // A title split over two blocks ("CHAPTER ONE" / "The Beginning") shows
    // up as two close candidates on one page with matching style.
    std::vector<Chapter> merged;
    for (auto& chapter : candidates) {
        if (!merged.empty() && merged.back().page == chapter.page) {
            Chapter& prev = merged.back();
            const Block* prev_block = by_id[prev.block_id];
            const Block* cur_block = by_id[chapter.block_id];

            if (prev_block && cur_block) {
                double gap = cur_block->y - (prev_block->y + prev_block->height);
                double max_gap = std::max(prev_block->font_size, cur_block->font_size) * 1.5;
                bool similar_font = std::fabs(prev_block->font_size - cur_block->font_size) <
                                    prev_block->font_size * 0.3;
                bool similar_style = prev_block->is_bold == cur_block->is_bold;

                if (gap < max_gap && similar_font && similar_style) {
                    prev.title = clip_title(trim(prev.title + " " + chapter.title));
                    prev.confidence = std::max(prev.confidence, chapter.confidence);
                    continue;
                }
            }
        }
        merged.push_back(std::move(chapter));
    }

    return merged;
}

} // namespace ds
