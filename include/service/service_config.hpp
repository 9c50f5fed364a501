#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace ds {

/**
 * @brief Runtime settings for the request handler and CLI
 */
struct ServiceConfig {
    bool verbose = false;                   ///< Diagnostics on stderr
    double default_render_scale = 2.0;      ///< render_page scale when none given
    int max_pages = 0;                      ///< Pages to analyze, 0 = all
    double min_image_size = 20.0;           ///< Smaller images are ignored
    bool compact_output = true;             ///< Garbage-collect saved documents

    /**
     * @brief Load configuration from JSON file
     */
    static ServiceConfig from_json_file(const std::string& path);

    static ServiceConfig from_json(const nlohmann::json& j);

    /**
     * @brief Load from environment variables (DOCSIFT_*)
     */
    static ServiceConfig from_environment();

    /**
     * @brief Override fields from DOCSIFT_* environment variables that are set
     */
    void apply_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;

    nlohmann::json to_json() const;
};

} // namespace ds
