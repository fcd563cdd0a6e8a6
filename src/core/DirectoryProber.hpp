#pragma once

#include "PathClassifier.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace companion_mcp {

/**
 * @brief Looks up a companion candidate among the immediate entries of a directory
 */
class DirectoryProber {
public:
    /**
     * @brief Find the first entry of @p dir with matching basename and role
     *
     * A missing or unreadable directory is treated as empty. Entries are
     * visited in the order the filesystem lists them, so when several entries
     * match, which one is returned is unspecified.
     *
     * @param dir Directory to list (not recursive)
     * @param basename Companion basename to match (see PathClassifier::basename_of)
     * @param role Required role of the entry
     * @param classifier Classifier used for both role and basename
     * @return Full path of the matching entry, or std::nullopt
     */
    static std::optional<std::filesystem::path> probe(
        const std::filesystem::path& dir,
        const std::string& basename,
        FileRole role,
        const PathClassifier& classifier
    );
};

} // namespace companion_mcp
