#include "analysis/analysis_session.hpp"
#include "util/text.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>

namespace ds {

void AnalysisSession::load(AnalysisResult result) {
    result_ = std::move(result);
}

void AnalysisSession::clear() {
    result_.reset();
}

const AnalysisResult& AnalysisSession::get_result() const {
    if (!result_) {
        throw std::runtime_error("No document analyzed");
    }
    return *result_;
}

const Block* AnalysisSession::find_block(const std::string& block_id) const {
    if (!result_) return nullptr;
    for (const auto& block : result_->blocks) {
        if (block.id == block_id) {
            return &block;
        }
    }
    return nullptr;
}

ExportResult AnalysisSession::export_text(const std::vector<std::string>& enabled_category_ids) const {
    ExportResult out;
    if (!result_) {
        return out;
    }

    std::set<std::string> enabled(enabled_category_ids.begin(), enabled_category_ids.end());

    std::vector<const Block*> ordered;
    for (const auto& block : result_->blocks) {
        if (enabled.count(block.category_id)) {
            ordered.push_back(&block);
        }
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const Block* a, const Block* b) {
        if (a->page != b->page) return a->page < b->page;
        if (a->y != b->y) return a->y < b->y;
        return a->x < b->x;
    });

    std::vector<std::string> lines;
    int current_page = -1;
    for (const Block* block : ordered) {
        if (block->page != current_page) {
            if (current_page >= 0) {
                lines.emplace_back();
            }
            current_page = block->page;
        }
        lines.push_back(block->text);
    }

    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out.text += '\n';
        out.text += lines[i];
    }
    out.char_count = utf8_length(out.text);
    return out;
}

SimilarResult AnalysisSession::find_similar(const std::string& block_id) const {
    SimilarResult out;
    const Block* target = find_block(block_id);
    if (!target) {
        return out;
    }

    for (const auto& block : result_->blocks) {
        if (block.category_id == target->category_id) {
            out.similar_ids.push_back(block.id);
        }
    }
    out.count = out.similar_ids.size();
    return out;
}

std::vector<Chapter> AnalysisSession::detect_chapters() const {
    ChapterDetector detector;
    return detector.detect(get_result());
}

} // namespace ds
