#include "cli/cli.hpp"
#include "analysis/analysis_session.hpp"
#include "analysis/document_analyzer.hpp"
#include "engine/mupdf_engine.hpp"
#include "redact/redaction_orchestrator.hpp"
#include "service/request_handler.hpp"
#include "service/service_config.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>

namespace fs = std::filesystem;

using namespace ds;

// ============== Helper Functions ==============

// --config file, then DOCSIFT_* environment, then --verbose
ServiceConfig load_config(const Args& args) {
    ServiceConfig config;
    if (args.has("config")) {
        config = ServiceConfig::from_json_file(args.require("config"));
    }
    config.apply_environment();
    if (args.get("verbose").as_bool()) {
        config.verbose = true;
    }

    std::string error;
    if (!config.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }
    return config;
}

void ensure_parent_dir(const std::string& path) {
    fs::path p(path);
    if (p.has_parent_path()) {
        fs::create_directories(p.parent_path());
    }
}

// Write JSON to a file, or to stdout when path is empty
void write_json(const nlohmann::json& j, const std::string& path, bool pretty) {
    const std::string text = pretty ? j.dump(2) : j.dump();
    if (path.empty()) {
        std::cout << text << "\n";
        return;
    }

    ensure_parent_dir(path);
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write output file: " + path);
    }
    file << text << "\n";
}

AnalysisResult run_analysis(MuPdfEngine& engine, const ServiceConfig& config,
                            const std::string& input, int max_pages) {
    DocumentAnalyzer analyzer(config.min_image_size);
    analyzer.set_verbose(config.verbose);
    return analyzer.analyze_file(engine, input, max_pages);
}

// Category ids for a list of ids or type names
std::vector<std::string> resolve_categories(const AnalysisResult& result,
                                            const std::vector<std::string>& wanted) {
    std::set<std::string> wanted_set(wanted.begin(), wanted.end());
    std::vector<std::string> ids;
    for (const auto& [id, category] : result.categories) {
        if (wanted_set.count(id) || wanted_set.count(category.type)) {
            ids.push_back(id);
        }
    }
    return ids;
}

// ============== docsift serve ==============
int cmd_serve(const Args& args) {
    ServiceConfig config = load_config(args);
    MuPdfEngine engine;
    RequestHandler handler(engine, config);

    if (config.verbose) {
        std::cerr << "docsift serving on stdin (MuPDF " << MuPdfEngine::library_version() << ")\n";
    }

    int failures = handler.serve(std::cin, std::cout);

    if (config.verbose) {
        std::cerr << "Input closed, " << failures << " failed requests\n";
    }
    return 0;
}

// ============== docsift analyze ==============
int cmd_analyze(const Args& args) {
    ServiceConfig config = load_config(args);
    MuPdfEngine engine;

    const std::string input = args.require("input");
    const int max_pages = args.get("max-pages").as_int(config.max_pages);

    AnalysisResult result = run_analysis(engine, config, input, max_pages);
    write_json(result.to_json(), args.get("output").value, args.get("pretty").as_bool());

    if (config.verbose) {
        std::cerr << "Analyzed " << result.page_count << " pages: "
                  << result.blocks.size() << " blocks in "
                  << result.categories.size() << " categories\n";
    }
    return 0;
}

// ============== docsift export ==============
int cmd_export(const Args& args) {
    ServiceConfig config = load_config(args);
    MuPdfEngine engine;

    const std::string input = args.require("input");
    AnalysisSession session;
    session.load(run_analysis(engine, config, input, config.max_pages));

    std::vector<std::string> wanted = args.get("categories").as_list();
    std::vector<std::string> ids = resolve_categories(session.get_result(), wanted);
    if (ids.empty()) {
        throw std::invalid_argument("No category matches --categories");
    }

    ExportResult exported = session.export_text(ids);

    const std::string output = args.get("output").value;
    if (output.empty()) {
        std::cout << exported.text << "\n";
    } else {
        ensure_parent_dir(output);
        std::ofstream file(output);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot write output file: " + output);
        }
        file << exported.text;
        std::cerr << "Exported " << exported.char_count << " characters to " << output << "\n";
    }
    return 0;
}

// ============== docsift similar ==============
int cmd_similar(const Args& args) {
    ServiceConfig config = load_config(args);
    MuPdfEngine engine;

    AnalysisSession session;
    session.load(run_analysis(engine, config, args.require("input"), config.max_pages));

    SimilarResult similar = session.find_similar(args.require("block"));
    write_json(similar.to_json(), "", args.get("pretty").as_bool());
    return similar.count > 0 ? 0 : 1;
}

// ============== docsift render ==============
int cmd_render(const Args& args) {
    ServiceConfig config = load_config(args);
    MuPdfEngine engine;

    const std::string input = args.require("input");
    const std::string output = args.require("output");
    const int page = args.get("page").as_int(0);
    const double scale = args.get("scale").as_double(config.default_render_scale);
    if (scale <= 0.0) {
        throw std::invalid_argument("--scale must be positive");
    }

    std::unique_ptr<Document> doc = engine.open(input);
    std::vector<unsigned char> png = doc->rasterize(page, scale);

    ensure_parent_dir(output);
    std::ofstream file(output, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write output file: " + output);
    }
    file.write(reinterpret_cast<const char*>(png.data()), static_cast<std::streamsize>(png.size()));

    if (config.verbose) {
        std::cerr << "Rendered page " << page << " at scale " << scale
                  << " to " << output << " (" << png.size() << " bytes)\n";
    }
    return 0;
}

// ============== docsift outline ==============
int cmd_outline(const Args& args) {
    ServiceConfig config = load_config(args);
    MuPdfEngine engine;

    RedactionOrchestrator orchestrator;
    orchestrator.set_verbose(config.verbose);

    nlohmann::json bookmarks = nlohmann::json::array();
    for (const auto& bm : orchestrator.extract_outline(engine, args.require("input"))) {
        bookmarks.push_back(bm.to_json());
    }
    write_json({{"bookmarks", bookmarks}}, args.get("output").value, args.get("pretty").as_bool());
    return 0;
}

// ============== docsift chapters ==============
int cmd_chapters(const Args& args) {
    ServiceConfig config = load_config(args);
    MuPdfEngine engine;

    const std::string input = args.require("input");
    nlohmann::json chapters = nlohmann::json::array();

    // Prefer the document's own outline when it has one
    std::unique_ptr<Document> doc = engine.open(input);
    std::vector<TocEntry> toc = doc->get_toc();
    doc.reset();

    std::vector<Chapter> found;
    if (!toc.empty() && !args.get("heuristic").as_bool()) {
        found = ChapterDetector::from_toc(toc);
    } else {
        AnalysisSession session;
        session.load(run_analysis(engine, config, input, config.max_pages));
        found = session.detect_chapters();
    }

    for (const auto& chapter : found) {
        chapters.push_back(chapter.to_json());
    }
    write_json({{"chapters", chapters}}, args.get("output").value, args.get("pretty").as_bool());
    return 0;
}

// ============== docsift redact ==============
int cmd_redact(const Args& args) {
    ServiceConfig config = load_config(args);
    MuPdfEngine engine;

    const std::string input = args.require("input");
    const std::string output = args.require("output");

    RedactionRequest request;
    if (args.has("regions")) {
        request = RedactionRequest::load_from_json(args.require("regions"));
    }
    for (int page : args.get("delete-pages").as_int_list()) {
        request.deleted_pages.push_back(page);
    }

    RedactionOrchestrator orchestrator;
    orchestrator.set_verbose(config.verbose);

    ensure_parent_dir(output);
    RedactionReport report = orchestrator.redact_file(engine, input, output, request,
                                                      config.compact_output);

    std::cout << "Redacted PDF saved to: " << output << "\n";
    std::cout << "  Pages redacted:  " << report.pages_redacted << "\n";
    std::cout << "  Text matches:    " << report.regions_text_matched << "\n";
    std::cout << "  Fallbacks:       " << report.regions_coordinate_fallback << "\n";
    std::cout << "  Pages deleted:   " << report.pages_deleted.size() << "\n";
    std::cout << "  Bookmarks:       " << report.bookmarks_written << "\n";
    std::cout << "  Final pages:     " << report.final_page_count << "\n";
    return 0;
}

// ============== Main ==============
int main(int argc, char** argv) {
    CLI cli("docsift", "1.0.0", "PDF structure analysis and redaction");

    cli.register_common_arg({"config", "c", "Path to JSON config file", "", false, false});
    cli.register_common_arg({"verbose", "v", "Print diagnostics to stderr", "", false, true});

    cli.register_command({
        "serve",
        "Answer JSON requests, one per line on stdin",
        {},
        cmd_serve
    });

    cli.register_command({
        "analyze",
        "Extract blocks and categories from a PDF",
        {
            {"input", "i", "Input PDF file", "", true, false},
            {"output", "o", "Output JSON file (default: stdout)", "", false, false},
            {"max-pages", "m", "Pages to analyze, 0 for all", "", false, false},
            {"pretty", "p", "Indent JSON output", "", false, true}
        },
        cmd_analyze
    });

    cli.register_command({
        "export",
        "Export the text of selected categories in reading order",
        {
            {"input", "i", "Input PDF file", "", true, false},
            {"categories", "t", "Comma-separated category ids or types", "body,heading,subheading,title", false, false},
            {"output", "o", "Output text file (default: stdout)", "", false, false}
        },
        cmd_export
    });

    cli.register_command({
        "similar",
        "List blocks in the same category as a block",
        {
            {"input", "i", "Input PDF file", "", true, false},
            {"block", "b", "Block id", "", true, false},
            {"pretty", "p", "Indent JSON output", "", false, true}
        },
        cmd_similar
    });

    cli.register_command({
        "render",
        "Render one page to PNG",
        {
            {"input", "i", "Input PDF file", "", true, false},
            {"output", "o", "Output PNG file", "", true, false},
            {"page", "n", "Page index (0-based)", "0", false, false},
            {"scale", "s", "Zoom factor (default from config)", "", false, false}
        },
        cmd_render
    });

    cli.register_command({
        "outline",
        "Print the bookmarks of a PDF",
        {
            {"input", "i", "Input PDF file", "", true, false},
            {"output", "o", "Output JSON file (default: stdout)", "", false, false},
            {"pretty", "p", "Indent JSON output", "", false, true}
        },
        cmd_outline
    });

    cli.register_command({
        "chapters",
        "Find chapter starts from the outline or by layout",
        {
            {"input", "i", "Input PDF file", "", true, false},
            {"output", "o", "Output JSON file (default: stdout)", "", false, false},
            {"heuristic", "e", "Ignore the outline and detect from layout", "", false, true},
            {"pretty", "p", "Indent JSON output", "", false, true}
        },
        cmd_chapters
    });

    cli.register_command({
        "redact",
        "Remove regions, delete pages and rewrite bookmarks",
        {
            {"input", "i", "Input PDF file", "", true, false},
            {"output", "o", "Output PDF file", "", true, false},
            {"regions", "r", "JSON file with regions, deletedPages and bookmarks", "", false, false},
            {"delete-pages", "d", "Comma-separated page indices to delete (0-based)", "", false, false}
        },
        cmd_redact
    });

    return cli.run(argc, argv);
}
