#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <regex>
#include <stdexcept>
#include <string>

namespace companion_mcp {

/**
 * @brief Cooperative cancellation flag shared between a caller and a scan
 */
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
    bool is_cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * @brief Raised when a content scan cannot be performed at all
 */
class ScanError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Receives each matching line; return false to stop the scan
 */
using MatchHandler = std::function<bool(const std::filesystem::path& file, const std::string& line)>;

/**
 * @brief Decides whether a file is worth reading
 */
using FileFilter = std::function<bool(const std::filesystem::path& file)>;

/**
 * @brief Abstract recursive content search
 *
 * Implementations report (file, line) pairs for every line under @p root that
 * matches @p pattern, in discovery order. Returning normally means end of
 * stream; failure to scan at all is reported by throwing ScanError.
 */
class IContentScanner {
public:
    virtual ~IContentScanner() = default;

    /**
     * @brief Scan a directory tree
     *
     * @param root Directory to search recursively
     * @param pattern Line pattern (matched with std::regex_search)
     * @param filter Files rejected by the filter are never opened (may be empty)
     * @param token Checked between files and lines; the scan returns once cancelled
     * @param on_match Called for every matching line until it returns false
     */
    virtual void scan(
        const std::filesystem::path& root,
        const std::regex& pattern,
        const FileFilter& filter,
        const CancellationToken& token,
        const MatchHandler& on_match
    ) = 0;
};

/**
 * @brief In-process scanner: recursive directory walk plus line matching
 *
 * Permission-denied directories and unreadable files are skipped. Files whose
 * first block contains a NUL byte are treated as binary and skipped.
 *
 * Leading whitespace is stripped before a line is matched and reported. Lines
 * still longer than kMaxLineLength are never matched: std::regex recurses per
 * character and would exhaust the stack.
 */
class RecursiveContentScanner : public IContentScanner {
public:
    static constexpr size_t kMaxLineLength = 4096;

    void scan(
        const std::filesystem::path& root,
        const std::regex& pattern,
        const FileFilter& filter,
        const CancellationToken& token,
        const MatchHandler& on_match
    ) override;

private:
    /**
     * @brief Scan one file
     * @return false when the handler asked to stop or the token was cancelled
     */
    static bool scan_file(
        const std::filesystem::path& file,
        const std::regex& pattern,
        const CancellationToken& token,
        const MatchHandler& on_match
    );
};

} // namespace companion_mcp
