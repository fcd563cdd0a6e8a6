#include "ResolverConfig.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <fstream>

namespace companion_mcp {

using json = nlohmann::json;

namespace {

std::set<std::string> read_extensions(const json& doc, const char* key) {
    const auto& list = doc.at(key);
    if (!list.is_array()) {
        throw ConfigError(std::string(key) + " must be an array of strings");
    }

    std::set<std::string> extensions;
    for (const auto& item : list) {
        std::string ext = item.get<std::string>();
        if (ext.empty() || ext == ".") {
            throw ConfigError(std::string(key) + " contains an empty extension");
        }
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (ext.front() != '.') {
            ext.insert(ext.begin(), '.');
        }
        extensions.insert(ext);
    }
    return extensions;
}

}  // namespace

ResolverConfig ResolverConfig::load(const std::filesystem::path& file) {
    std::ifstream in(file);
    if (!in) {
        throw ConfigError("Cannot open config file: " + file.string());
    }

    ResolverConfig config;
    try {
        json doc = json::parse(in);
        if (!doc.is_object()) {
            throw ConfigError("Config root must be an object: " + file.string());
        }

        if (doc.contains("header_extensions")) {
            config.extensions.header_extensions = read_extensions(doc, "header_extensions");
        }
        if (doc.contains("source_extensions")) {
            config.extensions.source_extensions = read_extensions(doc, "source_extensions");
        }
        if (doc.contains("companion_suffixes")) {
            config.extensions.companion_suffixes =
                doc.at("companion_suffixes").get<std::vector<std::string>>();
        }
        if (doc.contains("search_timeout_ms")) {
            config.search_timeout = std::chrono::milliseconds(doc.at("search_timeout_ms").get<long long>());
        }
        if (doc.contains("search_scope")) {
            config.search_scope = scope_from_string(doc.at("search_scope").get<std::string>());
        }
        if (doc.contains("project_root")) {
            config.project_root = doc.at("project_root").get<std::string>();
        }
    } catch (const json::exception& e) {
        throw ConfigError("Invalid config file " + file.string() + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw ConfigError("Invalid config file " + file.string() + ": " + e.what());
    }

    config.validate();
    spdlog::info("Loaded config from {}", file.string());
    return config;
}

void ResolverConfig::validate() const {
    if (search_timeout.count() <= 0) {
        throw ConfigError("search_timeout_ms must be positive");
    }
    if (extensions.header_extensions.empty() || extensions.source_extensions.empty()) {
        throw ConfigError("header_extensions and source_extensions must not be empty");
    }

    for (const auto& ext : extensions.header_extensions) {
        if (extensions.source_extensions.count(ext) != 0) {
            throw ConfigError("Extension is both header and source: " + ext);
        }
    }
}

} // namespace companion_mcp
