#include "service/service_config.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace ds {

namespace {

bool parse_bool(const std::string& value) {
    return value == "1" || value == "true" || value == "TRUE" ||
           value == "yes" || value == "on";
}

}  // namespace

ServiceConfig ServiceConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    nlohmann::json j;
    file >> j;
    return from_json(j);
}

ServiceConfig ServiceConfig::from_json(const nlohmann::json& j) {
    ServiceConfig config;
    if (!j.is_object()) {
        throw std::invalid_argument("Config must be a JSON object");
    }

    if (j.contains("verbose")) config.verbose = j["verbose"].get<bool>();
    if (j.contains("default_render_scale")) {
        config.default_render_scale = j["default_render_scale"].get<double>();
    } else if (j.contains("render_scale")) {
        config.default_render_scale = j["render_scale"].get<double>();
    }
    if (j.contains("max_pages")) config.max_pages = j["max_pages"].get<int>();
    if (j.contains("min_image_size")) config.min_image_size = j["min_image_size"].get<double>();
    if (j.contains("compact_output")) config.compact_output = j["compact_output"].get<bool>();

    return config;
}

ServiceConfig ServiceConfig::from_environment() {
    ServiceConfig config;
    config.apply_environment();
    return config;
}

void ServiceConfig::apply_environment() {
    const char* verbose_env = std::getenv("DOCSIFT_VERBOSE");
    if (verbose_env) verbose = parse_bool(verbose_env);

    const char* scale = std::getenv("DOCSIFT_RENDER_SCALE");
    if (scale) {
        try {
            default_render_scale = std::stod(scale);
        } catch (const std::exception&) {
            throw std::invalid_argument(std::string("Invalid DOCSIFT_RENDER_SCALE: ") + scale);
        }
    }

    const char* pages = std::getenv("DOCSIFT_MAX_PAGES");
    if (pages) {
        try {
            max_pages = std::stoi(pages);
        } catch (const std::exception&) {
            throw std::invalid_argument(std::string("Invalid DOCSIFT_MAX_PAGES: ") + pages);
        }
    }
}

bool ServiceConfig::validate(std::string& error_message) const {
    if (default_render_scale <= 0.0) {
        error_message = "Render scale must be positive";
        return false;
    }

    if (max_pages < 0) {
        error_message = "max_pages must be 0 (all pages) or positive";
        return false;
    }

    if (min_image_size < 0.0) {
        error_message = "min_image_size must not be negative";
        return false;
    }

    return true;
}

nlohmann::json ServiceConfig::to_json() const {
    nlohmann::json j;
    j["verbose"] = verbose;
    j["default_render_scale"] = default_render_scale;
    j["max_pages"] = max_pages;
    j["min_image_size"] = min_image_size;
    j["compact_output"] = compact_output;
    return j;
}

} // namespace ds
