#include "analysis/analysis_session.hpp"
#include "analysis/document_analyzer.hpp"
#include "engine/mupdf_engine.hpp"
#include "redact/redaction_orchestrator.hpp"
#include <iostream>
#include <iomanip>
#include <sys/stat.h>
#include <sys/types.h>

using namespace ds;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(70, '=') << "\n\n";
}

void print_block_preview(const Block& block, size_t max_length = 70) {
    std::string preview = block.text;
    if (preview.length() > max_length) {
        preview = preview.substr(0, max_length) + "...";
    }
    std::cout << "    [p" << block.page << " y=" << std::fixed << std::setprecision(0)
              << block.y << "] \"" << preview << "\"\n";
}

int main(int argc, char** argv) {
    print_separator("Document Analysis Example");

    const std::string pdf_path = argc > 1 ? argv[1] : "../../tests/sample.pdf";
    const std::string output_dir = "output";
    mkdir(output_dir.c_str(), 0755);

    std::cout << "MuPDF version: " << MuPdfEngine::library_version() << "\n";

    MuPdfEngine engine;
    DocumentAnalyzer analyzer;
    analyzer.set_verbose(true);

    // =========================================================================
    // Example 1: Analyze and list categories
    // =========================================================================

    print_separator("Example 1: Categories");

    AnalysisSession session;
    try {
        session.load(analyzer.analyze_file(engine, pdf_path, 5));
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    const AnalysisResult& result = session.get_result();
    std::cout << "Body font size: " << result.body_font_size << "pt\n\n";
    for (const auto& [id, cat] : result.categories) {
        std::cout << "  " << std::left << std::setw(18) << cat.name
                  << cat.color << "  " << std::right << std::setw(5) << cat.block_count
                  << " blocks  " << std::setw(7) << cat.char_count << " chars\n";
    }

    // =========================================================================
    // Example 2: Export the main text
    // =========================================================================

    print_separator("Example 2: Export");

    std::vector<std::string> keep;
    for (const auto& [id, cat] : result.categories) {
        if (cat.type == category_type::BODY || cat.type == category_type::HEADING ||
            cat.type == category_type::SUBHEADING) {
            keep.push_back(id);
        }
    }
    ExportResult exported = session.export_text(keep);
    std::cout << "Exported " << exported.char_count << " characters\n";
    std::cout << exported.text.substr(0, 300) << "\n";

    // =========================================================================
    // Example 3: Chapters
    // =========================================================================

    print_separator("Example 3: Chapter candidates");

    for (const auto& chapter : session.detect_chapters()) {
        std::cout << "  L" << chapter.level << " p" << chapter.page << "  " << chapter.title
                  << " (" << std::setprecision(1) << chapter.confidence << ")\n";
    }

    // =========================================================================
    // Example 4: Remove footers and page numbers
    // =========================================================================

    print_separator("Example 4: Redaction");

    RedactionRequest request;
    for (const auto& block : result.blocks) {
        const Category& cat = result.categories.at(block.category_id);
        if (cat.type == category_type::FOOTER || cat.type == category_type::HEADER) {
            print_block_preview(block);
            RedactionRegion region;
            region.page = block.page;
            region.x = block.x;
            region.y = block.y;
            region.width = block.width;
            region.height = block.height;
            region.text = block.text;
            region.is_image = block.is_image;
            request.regions.push_back(region);
        }
    }

    RedactionOrchestrator orchestrator;
    orchestrator.set_verbose(true);
    try {
        RedactionReport report = orchestrator.redact_file(engine, pdf_path,
                                                          output_dir + "/cleaned.pdf", request);
        std::cout << "\nReport: " << report.to_json().dump(2) << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
