#include "FrameworkStructure.hpp"
#include <iterator>

namespace companion_mcp {

namespace {

constexpr const char* kSourcesFolder = "Sources";
constexpr const char* kHeaderFolders[] = {"Headers", "PrivateHeaders"};

// Appending an empty path would leave a trailing separator
std::filesystem::path join(const std::filesystem::path& base, const std::filesystem::path& sub) {
    return sub.empty() ? base : base / sub;
}

}  // namespace

std::optional<FrameworkStructure> framework_structure_for(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> segments;
    for (const auto& segment : dir) {
        // Trailing separators show up as empty elements
        if (!segment.empty()) {
            segments.push_back(segment);
        }
    }

    // Deepest "Sources" segment wins
    size_t sources_index = segments.size();
    for (size_t i = segments.size(); i > 0; --i) {
        if (segments[i - 1] == kSourcesFolder) {
            sources_index = i - 1;
            break;
        }
    }

    if (sources_index == segments.size() || sources_index == 0) {
        return std::nullopt;
    }

    const auto& parent = segments[sources_index - 1];
    if (!parent.has_filename()) {
        // "Sources" directly below the filesystem root
        return std::nullopt;
    }

    FrameworkStructure structure;
    structure.framework_name = parent.string();
    for (size_t i = 0; i < sources_index; ++i) {
        structure.framework_path /= segments[i];
    }

    for (size_t i = sources_index + 1; i < segments.size(); ++i) {
        structure.framework_sub_folder /= segments[i];
    }

    return structure;
}

std::vector<std::filesystem::path> header_search_dirs(const FrameworkStructure& structure) {
    const auto& sub = structure.framework_sub_folder;

    // Sources/<name>/<rest> mirrors Headers/<rest>
    std::optional<std::filesystem::path> rest;
    auto first = sub.begin();
    if (first != sub.end() && *first == structure.framework_name) {
        rest.emplace();
        for (auto it = std::next(first); it != sub.end(); ++it) {
            if (!it->empty()) {
                *rest /= *it;
            }
        }
    }

    std::vector<std::filesystem::path> dirs;
    for (const char* folder : kHeaderFolders) {
        auto umbrella = structure.framework_path / folder / structure.framework_name;
        auto flat = structure.framework_path / folder;

        dirs.push_back(join(umbrella, sub));
        if (rest) {
            dirs.push_back(join(umbrella, *rest));
            dirs.push_back(join(flat, *rest));
        } else {
            dirs.push_back(join(flat, sub));
        }
    }
    return dirs;
}

} // namespace companion_mcp
