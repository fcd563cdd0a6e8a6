#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace companion_mcp {

/**
 * @brief Location of a directory inside a framework-style source layout
 *
 * For "/p/Fwk/Sources/Fwk/Sub":
 *   framework_path       = "/p/Fwk"
 *   framework_name       = "Fwk"
 *   framework_sub_folder = "Fwk/Sub"
 */
struct FrameworkStructure {
    std::filesystem::path framework_path;        // Path ending at the parent of "Sources"
    std::string framework_name;                  // Name of the parent of "Sources"
    std::filesystem::path framework_sub_folder;  // Everything below "Sources", may be empty
};

/**
 * @brief Detect a framework layout from a directory path
 *
 * Scans the segments of @p dir from the deepest one for a segment equal to
 * "Sources". Pure string computation, no I/O.
 *
 * @param dir Directory containing a source file
 * @return Structure, or std::nullopt when there is no "Sources" segment with a parent
 */
std::optional<FrameworkStructure> framework_structure_for(const std::filesystem::path& dir);

/**
 * @brief Header directories to probe for a framework, in priority order
 *
 * "Headers" entries come before "PrivateHeaders" entries. For each folder:
 *   <folder>/<name>/<sub_folder>
 * and, when sub_folder starts with the framework name (Sources/<name>/<rest>):
 *   <folder>/<name>/<rest>, then <folder>/<rest>
 * otherwise:
 *   <folder>/<sub_folder>
 */
std::vector<std::filesystem::path> header_search_dirs(const FrameworkStructure& structure);

} // namespace companion_mcp
