#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace companion_mcp {

/**
 * @brief Role of a file in a header/source pair
 */
enum class FileRole {
    HEADER,   // Declarations (.h, .hpp, ...)
    SOURCE,   // Implementation (.c, .cpp, .m, ...)
    OTHER     // Anything else
};

/**
 * @brief Extension membership table used for classification
 *
 * Extensions are stored lowercase with the leading dot. Multi-part
 * extensions (e.g. ".inl.h") are allowed; the longest match wins.
 */
struct ExtensionTable {
    std::set<std::string> header_extensions;
    std::set<std::string> source_extensions;

    /// Conventional name suffixes stripped from companion basenames ("-inl", "Internal")
    std::vector<std::string> companion_suffixes;

    static ExtensionTable defaults();
};

/**
 * @brief Classifies paths as header/source and extracts companion basenames
 *
 * Pure functions of the path string; never touch the filesystem and never throw.
 */
class PathClassifier {
public:
    PathClassifier();
    explicit PathClassifier(ExtensionTable table);

    /**
     * @brief Classify a path by its (case-insensitive) extension
     *
     * @param path File path
     * @return HEADER, SOURCE or OTHER
     */
    FileRole classify(const std::filesystem::path& path) const;

    /**
     * @brief Name used to pair a header with its source
     *
     * Strips the role extension and any conventional companion suffix.
     * For OTHER files only the last extension is removed.
     *
     * @param path File path
     * @return Basename, e.g. "Foo" for "dir/Foo-inl.h"
     */
    std::string basename_of(const std::filesystem::path& path) const;

    bool is_header(const std::filesystem::path& path) const;
    bool is_source(const std::filesystem::path& path) const;

    const ExtensionTable& table() const { return table_; }

private:
    /**
     * @brief Longest table extension that the lowercase file name ends with
     * @return Length of the matched extension, 0 when none matches
     */
    static size_t match_extension(const std::string& lower_name,
                                  const std::set<std::string>& extensions);

    ExtensionTable table_;
};

/**
 * @brief Convert FileRole to string name ("header", "source", "other")
 */
std::string_view to_string(FileRole role);

/**
 * @brief Parse a role name; unknown names map to OTHER
 */
FileRole role_from_string(std::string_view name);

}  // namespace companion_mcp
