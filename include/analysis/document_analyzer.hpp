#pragma once

#include "analysis/block.hpp"
#include "analysis/block_extractor.hpp"
#include "analysis/category_classifier.hpp"
#include "analysis/category_synthesizer.hpp"
#include "engine/document.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ds {

/**
 * @brief Everything one analysis pass produces
 */
struct AnalysisResult {
    std::string source_path;
    std::string pdf_name;
    int page_count = 0;                      ///< Pages analyzed
    std::vector<PageSize> page_dimensions;
    std::vector<Block> blocks;
    CategoryMap categories;
    double body_font_size = CategoryClassifier::kDefaultBodyFontSize;

    nlohmann::json to_json() const;
};

/**
 * @brief Runs extraction, classification and category synthesis
 */
class DocumentAnalyzer {
public:
    explicit DocumentAnalyzer(double min_image_size = 20.0);

    /**
     * @brief Analyze an open document
     *
     * @param doc Open document
     * @param max_pages Analyze only the first max_pages pages (0 = all)
     */
    AnalysisResult analyze(Document& doc, int max_pages = 0) const;

    /**
     * @brief Open, analyze and close a document
     * @throws DocumentError if the document cannot be opened
     */
    AnalysisResult analyze_file(DocumentEngine& engine, const std::string& path,
                                int max_pages = 0) const;

    /**
     * @brief Classification and category synthesis over ready-made blocks
     */
    void categorize(AnalysisResult& result) const;

    void set_verbose(bool verbose) { verbose_ = verbose; }

private:
    BlockExtractor extractor_;
    CategoryClassifier classifier_;
    CategorySynthesizer synthesizer_;
    bool verbose_ = false;
};

} // namespace ds
