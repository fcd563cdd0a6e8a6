#pragma once

#include "IncludeSearch.hpp"
#include "PathClassifier.hpp"
#include <chrono>
#include <filesystem>
#include <stdexcept>

namespace companion_mcp {

/**
 * @brief Raised for unreadable or invalid configuration
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Settings for companion resolution
 *
 * Example JSON file (every key optional):
 * @code
 * {
 *   "header_extensions": [".h", ".hpp"],
 *   "source_extensions": [".c", ".cpp", ".m", ".mm"],
 *   "companion_suffixes": ["-inl", "Internal"],
 *   "search_timeout_ms": 15000,
 *   "search_scope": "header_directory",
 *   "project_root": "/path/to/project"
 * }
 * @endcode
 */
struct ResolverConfig {
    static constexpr std::chrono::milliseconds kDefaultSearchTimeout{15000};

    ExtensionTable extensions = ExtensionTable::defaults();
    std::chrono::milliseconds search_timeout = kDefaultSearchTimeout;
    SearchScope search_scope = SearchScope::HEADER_DIRECTORY;

    /// Default project root for tools when a request does not name one (may be empty)
    std::filesystem::path project_root;

    /**
     * @brief Load configuration from a JSON file
     *
     * Keys missing from the file keep their defaults.
     *
     * @throws ConfigError if the file cannot be read or holds invalid values
     */
    static ResolverConfig load(const std::filesystem::path& file);

    /**
     * @brief Check value ranges
     * @throws ConfigError on invalid values
     */
    void validate() const;
};

} // namespace companion_mcp
