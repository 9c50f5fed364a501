#include "analysis/document_analyzer.hpp"
#include "util/text.hpp"
#include <algorithm>
#include <iostream>
#include <iterator>
#include <memory>

namespace ds {

// ============================================================================
// AnalysisResult
// ============================================================================

nlohmann::json AnalysisResult::to_json() const {
    nlohmann::json j;

    nlohmann::json blocks_arr = nlohmann::json::array();
    for (const auto& block : blocks) {
        blocks_arr.push_back(block.to_json());
    }
    j["blocks"] = blocks_arr;

    nlohmann::json categories_obj = nlohmann::json::object();
    for (const auto& [id, category] : categories) {
        categories_obj[id] = category.to_json();
    }
    j["categories"] = categories_obj;

    j["page_count"] = page_count;

    nlohmann::json dims = nlohmann::json::array();
    for (const auto& size : page_dimensions) {
        dims.push_back({{"width", size.width}, {"height", size.height}});
    }
    j["page_dimensions"] = dims;
    j["pdf_name"] = pdf_name;
    j["body_font_size"] = body_font_size;

    return j;
}

// ============================================================================
// DocumentAnalyzer
// ============================================================================

DocumentAnalyzer::DocumentAnalyzer(double min_image_size)
    : extractor_(min_image_size) {}

AnalysisResult DocumentAnalyzer::analyze(Document& doc, int max_pages) const {
    AnalysisResult result;

    int page_count = doc.page_count();
    if (max_pages > 0) {
        page_count = std::min(page_count, max_pages);
    }
    result.page_count = page_count;

    for (int page = 0; page < page_count; ++page) {
        result.page_dimensions.push_back(doc.page_dimensions(page));
    }

    for (int page = 0; page < page_count; ++page) {
        auto page_blocks = extractor_.extract_page(doc, page, result.page_dimensions[page]);
        if (verbose_) {
            std::cerr << "  Page " << (page + 1) << ": " << page_blocks.size() << " blocks"
                      << std::endl;
        }
        result.blocks.insert(result.blocks.end(),
                             std::make_move_iterator(page_blocks.begin()),
                             std::make_move_iterator(page_blocks.end()));
    }

    categorize(result);
    return result;
}

AnalysisResult DocumentAnalyzer::analyze_file(DocumentEngine& engine, const std::string& path,
                                              int max_pages) const {
    if (verbose_) {
        std::cerr << "Analyzing: " << path << std::endl;
    }

    std::unique_ptr<Document> doc = engine.open(path);
    AnalysisResult result = analyze(*doc, max_pages);
    result.source_path = path;
    result.pdf_name = file_name_of(path);

    if (verbose_) {
        std::cerr << "  Total: " << result.blocks.size() << " blocks in "
                  << result.categories.size() << " categories, body size "
                  << result.body_font_size << std::endl;
    }

    return result;
}

void DocumentAnalyzer::categorize(AnalysisResult& result) const {
    result.body_font_size = CategoryClassifier::compute_body_font_size(result.blocks);
    auto types = classifier_.classify_all(result.blocks, result.body_font_size);
    result.categories = synthesizer_.synthesize(result.blocks, types);
}

} // namespace ds
