#pragma once

#include "ContentScanner.hpp"
#include "PathClassifier.hpp"
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

namespace companion_mcp {

/**
 * @brief Which directory tree the include search walks
 */
enum class SearchScope {
    HEADER_DIRECTORY,   // The header's own directory and everything below it
    PROJECT_ROOT        // The whole project tree
};

std::string_view to_string(SearchScope scope);

/**
 * @brief Parse "header_directory" / "project_root"
 * @throws std::invalid_argument for any other name
 */
SearchScope scope_from_string(std::string_view name);

/**
 * @brief Handle to an include search running on a background task
 *
 * Destroying the handle cancels the search and waits for the walk to finish,
 * so no background work or open file outlives the handle.
 */
class SearchHandle {
public:
    SearchHandle(std::shared_ptr<CancellationToken> token,
                 std::future<std::optional<std::filesystem::path>> result);
    ~SearchHandle();

    SearchHandle(SearchHandle&&) noexcept = default;
    SearchHandle& operator=(SearchHandle&&) = delete;
    SearchHandle(const SearchHandle&) = delete;
    SearchHandle& operator=(const SearchHandle&) = delete;

    /**
     * @brief Ask the search to stop; it finishes at the next file or line
     */
    void cancel();

    /**
     * @brief Wait until the search produced its result
     * @return true if the result is ready, false on timeout
     */
    bool wait_for(std::chrono::milliseconds timeout) const;

    /**
     * @brief Block for the result (callable once)
     *
     * @return Including source file, or std::nullopt when none was found or the search was cancelled
     * @throws ScanError if the scanner failed
     */
    std::optional<std::filesystem::path> get();

private:
    std::shared_ptr<CancellationToken> token_;
    std::future<std::optional<std::filesystem::path>> result_;
};

/**
 * @brief Finds a source file that includes a given header
 *
 * Two kinds of include directives are recognized:
 *
 * 1) Paths relative to the project root, e.g. #include <a/b.h>. Accepted as is
 *    when a project root was given; without one they are checked like (2).
 * 2) Paths relative to the including file, e.g. #include "../../a/b.h".
 *    Accepted only if the path resolves to the header.
 *
 * Matching is textual and approximate. When several files include the header,
 * the first one accepted in walk order is returned; that order depends on the
 * filesystem.
 */
class IncludeSearch {
public:
    IncludeSearch(PathClassifier classifier,
                  std::shared_ptr<IContentScanner> scanner,
                  SearchScope scope = SearchScope::HEADER_DIRECTORY);

    /**
     * @brief Build the include directive pattern for a header
     *
     * Group 1 captures a project-root relative path, group 2 a path to be
     * resolved against the including file.
     *
     * @param header Absolute, normalized header path
     * @param project_root Absolute, normalized project root
     * @return ECMAScript regular expression
     */
    static std::string build_include_pattern(const std::filesystem::path& header,
                                             const std::filesystem::path& project_root);

    /**
     * @brief Escape regular expression metacharacters
     */
    static std::string escape_regex(std::string_view text);

    /**
     * @brief Run the search on the calling thread
     *
     * @param header Header file (made absolute and normalized)
     * @param project_root Project root directory (made absolute and normalized);
     *        std::nullopt when unknown
     * @param token Cancels the search when set
     * @return First accepted including source, or std::nullopt
     * @throws std::invalid_argument on empty or malformed paths
     * @throws ScanError if the scanner failed
     */
    std::optional<std::filesystem::path> find_including_source_file(
        const std::filesystem::path& header,
        const std::optional<std::filesystem::path>& project_root,
        const CancellationToken& token
    ) const;

    /**
     * @brief Start the search on a background task
     *
     * Arguments are validated before the task starts.
     *
     * @throws std::invalid_argument on empty or malformed paths
     */
    SearchHandle start(const std::filesystem::path& header,
                       const std::optional<std::filesystem::path>& project_root) const;

    /**
     * @brief Decide whether a matched line really includes the header
     *
     * Only lines starting with '#' (after whitespace) and no longer than
     * kMaxDirectiveLength are matched against the pattern.
     *
     * @param file File containing the line
     * @param line Matched line
     * @param header Absolute, normalized header path
     * @param include_regex Pattern built by build_include_pattern()
     * @param trust_root_relative Accept group 1 without resolving it
     */
    bool accept_match(const std::filesystem::path& file,
                      const std::string& line,
                      const std::filesystem::path& header,
                      const std::regex& include_regex,
                      bool trust_root_relative = true) const;

    static constexpr size_t kMaxDirectiveLength = 4096;

    SearchScope scope() const { return scope_; }

private:
    std::filesystem::path search_root(const std::filesystem::path& header,
                                      const std::optional<std::filesystem::path>& project_root) const;

    PathClassifier classifier_;
    std::shared_ptr<IContentScanner> scanner_;
    SearchScope scope_;
};

/**
 * @brief Make a caller-supplied path absolute and lexically normal
 *
 * @param path Path to check
 * @param what Argument name for the error message
 * @param require_filename Reject paths ending in a separator or "."/".."
 * @throws std::invalid_argument on empty or malformed paths
 */
std::filesystem::path normalize_input_path(const std::filesystem::path& path,
                                           std::string_view what,
                                           bool require_filename);

/**
 * @brief normalize_input_path() for an optional project root
 */
std::optional<std::filesystem::path> normalize_project_root(
    const std::optional<std::filesystem::path>& project_root);

} // namespace companion_mcp
