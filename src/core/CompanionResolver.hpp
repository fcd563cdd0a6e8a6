#pragma once

#include "ContentScanner.hpp"
#include "IncludeSearch.hpp"
#include "PathClassifier.hpp"
#include "ResolverConfig.hpp"
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <optional>

namespace companion_mcp {

/**
 * @brief Finds the header of a source file and the source of a header
 *
 * Lookup order:
 *   header for source: same directory, then framework Headers/PrivateHeaders folders
 *   source for header: same directory, then a timeout-bounded include search
 *
 * Every call is an independent query; the resolver holds no mutable state and
 * may be shared between threads. "Not found" is std::nullopt, never an error.
 */
class CompanionResolver {
public:
    /**
     * @brief Construct resolver with the in-process content scanner
     */
    explicit CompanionResolver(ResolverConfig config = ResolverConfig{});

    /**
     * @brief Construct resolver with a custom content scanner
     * @param config Resolver settings
     * @param scanner Scanner used by the include search fallback
     */
    CompanionResolver(ResolverConfig config, std::shared_ptr<IContentScanner> scanner);

    /**
     * @brief Find the header declaring a source file
     *
     * @param source Source file path
     * @return Header path, or std::nullopt
     * @throws std::invalid_argument if @p source is empty or does not name a file
     */
    std::optional<std::filesystem::path> find_header_for_source(const std::filesystem::path& source) const;

    /**
     * @brief Find the source file implementing a header
     *
     * Blocks for at most the configured search timeout. Timeouts and scanner
     * failures are logged and reported as std::nullopt.
     *
     * @param header Header file path
     * @param project_root Project root used to match root-relative includes;
     *        without one every include path is resolved against its file
     * @return Source path, or std::nullopt
     * @throws std::invalid_argument if a path is empty or malformed
     */
    std::optional<std::filesystem::path> find_source_for_header(
        const std::filesystem::path& header,
        const std::optional<std::filesystem::path>& project_root = std::nullopt
    ) const;

    /**
     * @brief Asynchronous find_source_for_header()
     *
     * Arguments are validated on the calling thread.
     *
     * @throws std::invalid_argument if a path is empty or malformed
     */
    std::future<std::optional<std::filesystem::path>> find_source_for_header_async(
        const std::filesystem::path& header,
        const std::optional<std::filesystem::path>& project_root = std::nullopt
    ) const;

    /**
     * @brief Start an include search directly (no same-directory lookup, no timeout)
     *
     * The caller owns the handle and may cancel or wait on it.
     */
    SearchHandle find_including_source_file(
        const std::filesystem::path& header,
        const std::optional<std::filesystem::path>& project_root = std::nullopt
    ) const;

    const ResolverConfig& config() const { return config_; }
    const PathClassifier& classifier() const { return classifier_; }

private:
    std::optional<std::filesystem::path> find_header_in_framework(const std::filesystem::path& source) const;

    ResolverConfig config_;
    PathClassifier classifier_;
    IncludeSearch include_search_;
};

} // namespace companion_mcp
