#include "service/request_handler.hpp"
#include <iostream>
#include <stdexcept>

namespace ds {

// ============================================================================
// RequestArgs
// ============================================================================

RequestArgs::RequestArgs(const nlohmann::json& request)
    : positional_(nlohmann::json::array()), named_(nlohmann::json::object()) {
    if (request.contains("args")) {
        const auto& args = request["args"];
        if (!args.is_array()) {
            throw std::invalid_argument("\"args\" must be an array");
        }
        positional_ = args;
    }
    if (request.contains("params")) {
        const auto& params = request["params"];
        if (!params.is_object()) {
            throw std::invalid_argument("\"params\" must be an object");
        }
        named_ = params;
    }
}

const nlohmann::json* RequestArgs::find(size_t index, const std::string& name) const {
    auto it = named_.find(name);
    if (it != named_.end() && !it->is_null()) {
        return &(*it);
    }
    if (index < positional_.size() && !positional_[index].is_null()) {
        return &positional_[index];
    }
    return nullptr;
}

const nlohmann::json& RequestArgs::require(size_t index, const std::string& name) const {
    const nlohmann::json* value = find(index, name);
    if (!value) {
        throw std::invalid_argument("Missing argument: " + name);
    }
    return *value;
}

// ============================================================================
// RequestHandler
// ============================================================================

RequestHandler::RequestHandler(DocumentEngine& engine, const ServiceConfig& config)
    : engine_(engine),
      config_(config),
      analyzer_(config.min_image_size) {
    std::string error;
    if (!config_.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }

    analyzer_.set_verbose(config_.verbose);
    orchestrator_.set_verbose(config_.verbose);
    register_methods();
}

void RequestHandler::register_methods() {
    methods_["analyze"] = [this](const RequestArgs& a) { return analyze(a); };
    methods_["export"] = [this](const RequestArgs& a) { return export_text(a); };
    methods_["find_similar"] = [this](const RequestArgs& a) { return find_similar(a); };
    methods_["render_page"] = [this](const RequestArgs& a) { return render_page(a); };
    methods_["export_pdf"] = [this](const RequestArgs& a) { return export_pdf(a); };
    methods_["redact"] = [this](const RequestArgs& a) { return redact(a); };
    methods_["outline"] = [this](const RequestArgs& a) { return outline(a); };
    methods_["detect_chapters"] = [this](const RequestArgs& a) { return detect_chapters(a); };
}

std::vector<std::string> RequestHandler::get_methods() const {
    std::vector<std::string> names;
    for (const auto& [name, method] : methods_) {
        names.push_back(name);
    }
    return names;
}

nlohmann::json RequestHandler::handle(const nlohmann::json& request) {
    try {
        if (!request.is_object()) {
            throw std::invalid_argument("Request must be a JSON object");
        }

        std::string method;
        if (request.contains("method") && request["method"].is_string()) {
            method = request["method"].get<std::string>();
        }

        auto it = methods_.find(method);
        if (it == methods_.end()) {
            return {{"error", "Unknown method: " + method}};
        }

        RequestArgs args(request);
        return it->second(args);
    } catch (const std::exception& e) {
        if (config_.verbose) {
            std::cerr << "Request failed: " << e.what() << std::endl;
        }
        return {{"error", e.what()}};
    }
}

nlohmann::json RequestHandler::handle_line(const std::string& line) {
    nlohmann::json request;
    try {
        request = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        return {{"error", std::string("Invalid JSON: ") + e.what()}};
    }
    return handle(request);
}

int RequestHandler::serve(std::istream& in, std::ostream& out) {
    int failures = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        nlohmann::json response = handle_line(line);
        if (response.is_object() && response.contains("error")) {
            failures++;
        }
        out << response.dump() << std::endl;
    }
    return failures;
}

// ============================================================================
// Methods
// ============================================================================

nlohmann::json RequestHandler::analyze(const RequestArgs& args) {
    const std::string path = args.require(0, "path").get<std::string>();
    const int max_pages = args.get_or<int>(1, "max_pages", config_.max_pages);

    // Nothing from a previous document may survive a failed analysis
    session_.clear();
    AnalysisResult result = analyzer_.analyze_file(engine_, path, max_pages);
    nlohmann::json response = result.to_json();
    session_.load(std::move(result));
    return response;
}

nlohmann::json RequestHandler::export_text(const RequestArgs& args) {
    std::vector<std::string> enabled;
    if (const nlohmann::json* ids = args.find(0, "enabled_category_ids")) {
        enabled = ids->get<std::vector<std::string>>();
    }
    return session_.export_text(enabled).to_json();
}

nlohmann::json RequestHandler::find_similar(const RequestArgs& args) {
    std::string block_id;
    if (const nlohmann::json* id = args.find(0, "block_id")) {
        block_id = id->get<std::string>();
    }
    return session_.find_similar(block_id).to_json();
}

nlohmann::json RequestHandler::render_page(const RequestArgs& args) {
    const int page = args.get_or<int>(0, "page", 0);
    const double scale = args.get_or<double>(1, "scale", config_.default_render_scale);
    if (scale <= 0.0) {
        throw std::invalid_argument("Scale must be positive");
    }

    std::string path;
    if (const nlohmann::json* p = args.find(2, "path")) {
        path = p->get<std::string>();
    } else if (session_.has_analysis()) {
        path = session_.get_result().source_path;
    } else {
        throw std::runtime_error("No PDF loaded");
    }

    std::unique_ptr<Document> doc = engine_.open(path);
    std::vector<unsigned char> png = doc->rasterize(page, scale);
    return {{"image", engine_.encode_base64(png)}};
}

nlohmann::json RequestHandler::export_pdf(const RequestArgs& args) {
    const std::string path = args.require(0, "path").get<std::string>();

    std::vector<RedactionRegion> regions;
    if (const nlohmann::json* list = args.find(1, "deleted_regions")) {
        for (const auto& region : *list) {
            regions.push_back(RedactionRegion::from_json(region));
        }
    }

    std::vector<unsigned char> bytes =
        orchestrator_.export_pdf(engine_, path, regions, config_.compact_output);
    return {{"pdf_base64", engine_.encode_base64(bytes)}};
}

nlohmann::json RequestHandler::redact(const RequestArgs& args) {
    const std::string input = args.require(0, "input_path").get<std::string>();
    const std::string output = args.require(1, "output_path").get<std::string>();

    RedactionRequest request;
    if (const nlohmann::json* body = args.find(2, "request")) {
        request = RedactionRequest::from_json(*body);
    }

    RedactionReport report =
        orchestrator_.redact_file(engine_, input, output, request, config_.compact_output);
    return {{"success", true}, {"report", report.to_json()}};
}

nlohmann::json RequestHandler::outline(const RequestArgs& args) {
    const std::string path = args.require(0, "path").get<std::string>();

    nlohmann::json bookmarks = nlohmann::json::array();
    for (const auto& bm : orchestrator_.extract_outline(engine_, path)) {
        bookmarks.push_back(bm.to_json());
    }
    return {{"bookmarks", bookmarks}};
}

nlohmann::json RequestHandler::detect_chapters(const RequestArgs&) {
    nlohmann::json chapters = nlohmann::json::array();
    for (const auto& chapter : session_.detect_chapters()) {
        chapters.push_back(chapter.to_json());
    }
    return {{"chapters", chapters}};
}

} // namespace ds
