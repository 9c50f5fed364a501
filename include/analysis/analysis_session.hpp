#pragma once

#include "analysis/document_analyzer.hpp"
#include "analysis/chapter_detector.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ds {

/**
 * @brief Text export of the enabled categories
 */
struct ExportResult {
    std::string text;
    size_t char_count = 0;

    nlohmann::json to_json() const {
        return {{"text", text}, {"char_count", char_count}};
    }
};

/**
 * @brief Blocks sharing a category with a given block
 */
struct SimilarResult {
    std::vector<std::string> similar_ids;
    size_t count = 0;

    nlohmann::json to_json() const {
        return {{"similar_ids", similar_ids}, {"count", count}};
    }
};

/**
 * @brief State of the most recent analysis and the queries over it
 *
 * A session holds at most one analysis. Loading a new one discards the
 * previous blocks and categories entirely.
 */
class AnalysisSession {
public:
    AnalysisSession() = default;

    void load(AnalysisResult result);
    void clear();

    bool has_analysis() const { return result_.has_value(); }

    /**
     * @brief Current analysis
     * @throws std::runtime_error if nothing has been analyzed
     */
    const AnalysisResult& get_result() const;

    /**
     * @brief Text of blocks in the enabled categories, in reading order
     *
     * Blocks are ordered by (page, y, x). One empty line separates pages.
     */
    ExportResult export_text(const std::vector<std::string>& enabled_category_ids) const;

    /**
     * @brief Ids of all blocks in the same category as block_id
     *
     * Unknown ids yield an empty result.
     */
    SimilarResult find_similar(const std::string& block_id) const;

    std::vector<Chapter> detect_chapters() const;

    const Block* find_block(const std::string& block_id) const;

private:
    std::optional<AnalysisResult> result_;
};

} // namespace ds
