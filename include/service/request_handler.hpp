#pragma once

#include "analysis/analysis_session.hpp"
#include "analysis/document_analyzer.hpp"
#include "engine/document.hpp"
#include "redact/redaction_orchestrator.hpp"
#include "service/service_config.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <iosfwd>
#include <map>
#include <string>

namespace ds {

/**
 * @brief Arguments of one request, positional or named
 *
 * {"args": [a, b]} addresses values by position; {"params": {...}} by name.
 * When both are present the named value wins.
 */
class RequestArgs {
public:
    explicit RequestArgs(const nlohmann::json& request);

    /**
     * @brief Value at position index or under name, or nullptr if absent or null
     */
    const nlohmann::json* find(size_t index, const std::string& name) const;

    /**
     * @brief Required argument
     * @throws std::invalid_argument if missing
     */
    const nlohmann::json& require(size_t index, const std::string& name) const;

    template<typename T>
    T get_or(size_t index, const std::string& name, const T& fallback) const {
        const nlohmann::json* value = find(index, name);
        return value ? value->get<T>() : fallback;
    }

private:
    nlohmann::json positional_;
    nlohmann::json named_;
};

/**
 * @brief Dispatches JSON requests to the analysis and redaction components
 *
 * Owns the session, so the results of "analyze" are what later "export",
 * "find_similar" and "render_page" calls see. Every failure is turned into an
 * {"error": message} response; the handler stays usable afterwards.
 */
class RequestHandler {
public:
    using Method = std::function<nlohmann::json(const RequestArgs&)>;

    RequestHandler(DocumentEngine& engine, const ServiceConfig& config = ServiceConfig());

    /**
     * @brief Handle one request object
     */
    nlohmann::json handle(const nlohmann::json& request);

    /**
     * @brief Parse one line of JSON and handle it
     */
    nlohmann::json handle_line(const std::string& line);

    /**
     * @brief Answer one request per input line until end of input
     * @return Number of requests that produced an error
     */
    int serve(std::istream& in, std::ostream& out);

    std::vector<std::string> get_methods() const;

    const AnalysisSession& get_session() const { return session_; }
    const ServiceConfig& get_config() const { return config_; }

private:
    DocumentEngine& engine_;
    ServiceConfig config_;
    AnalysisSession session_;
    DocumentAnalyzer analyzer_;
    RedactionOrchestrator orchestrator_;
    std::map<std::string, Method> methods_;

    void register_methods();

    nlohmann::json analyze(const RequestArgs& args);
    nlohmann::json export_text(const RequestArgs& args);
    nlohmann::json find_similar(const RequestArgs& args);
    nlohmann::json render_page(const RequestArgs& args);
    nlohmann::json export_pdf(const RequestArgs& args);
    nlohmann::json redact(const RequestArgs& args);
    nlohmann::json outline(const RequestArgs& args);
    nlohmann::json detect_chapters(const RequestArgs& args);
};

} // namespace ds
