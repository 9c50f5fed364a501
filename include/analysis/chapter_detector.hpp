#pragma once

#include "analysis/document_analyzer.hpp"
#include "engine/document.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ds {

/**
 * @brief A chapter or section start, from the outline or from heuristics
 */
struct Chapter {
    std::string id;
    std::string title;
    int page = 0;                  ///< 0-indexed
    double y = 0.0;
    bool has_y = false;
    int level = 1;
    std::string source;            ///< "toc" or "heuristic"
    std::string block_id;          ///< Heuristic chapters only
    double confidence = 0.0;

    nlohmann::json to_json() const;
};

/**
 * @brief Finds chapter starts in an analyzed document
 *
 * Each candidate block accumulates confidence from independent signals
 * (title category, large font, chapter wording, bold near the top, short
 * text). Candidates reaching 0.4 are kept, and adjacent candidates that
 * look like one title broken over two blocks are merged.
 */
class ChapterDetector {
public:
    static constexpr double kMinConfidence = 0.4;

    std::vector<Chapter> detect(const AnalysisResult& result) const;

    /**
     * @brief Flattened outline entries as chapters with 0-indexed pages
     */
    static std::vector<Chapter> from_toc(const std::vector<TocEntry>& toc);

    static bool matches_chapter_pattern(const std::string& text);

    static int infer_level(const std::string& text, double font_size, double body_font_size);

    /**
     * @brief Shorten to 80 characters with an ellipsis
     */
    static std::string clip_title(const std::string& title);
};

} // namespace ds
