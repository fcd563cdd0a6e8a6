#include "PathClassifier.hpp"
#include <algorithm>
#include <cctype>

namespace companion_mcp {

namespace {

std::string to_lower(std::string_view text) {
    std::string lower(text.size(), '\0');
    std::transform(text.begin(), text.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

ExtensionTable ExtensionTable::defaults() {
    ExtensionTable table;
    table.header_extensions = {".h", ".hh", ".hpp", ".hxx", ".h++"};
    table.source_extensions = {".c", ".cc", ".cpp", ".cxx", ".c++", ".m", ".mm"};
    table.companion_suffixes = {"-inl", "Internal"};
    return table;
}

PathClassifier::PathClassifier()
    : table_(ExtensionTable::defaults()) {
}

PathClassifier::PathClassifier(ExtensionTable table)
    : table_(std::move(table)) {
}

size_t PathClassifier::match_extension(const std::string& lower_name,
                                       const std::set<std::string>& extensions) {
    size_t best = 0;
    for (const auto& ext : extensions) {
        // The extension must leave a non-empty stem (".h" alone is a dotfile)
        if (ext.size() > best && lower_name.size() > ext.size() && ends_with(lower_name, ext)) {
            best = ext.size();
        }
    }
    return best;
}

FileRole PathClassifier::classify(const std::filesystem::path& path) const {
    std::string name = to_lower(path.filename().string());
    if (name.empty()) {
        return FileRole::OTHER;
    }

    size_t header_len = match_extension(name, table_.header_extensions);
    size_t source_len = match_extension(name, table_.source_extensions);

    if (header_len == 0 && source_len == 0) {
        return FileRole::OTHER;
    }
    return header_len >= source_len ? FileRole::HEADER : FileRole::SOURCE;
}

std::string PathClassifier::basename_of(const std::filesystem::path& path) const {
    std::string name = path.filename().string();
    std::string lower = to_lower(name);

    FileRole role = classify(path);
    if (role == FileRole::OTHER) {
        return path.stem().string();
    }

    const auto& extensions = role == FileRole::HEADER
        ? table_.header_extensions
        : table_.source_extensions;
    std::string basename = name.substr(0, name.size() - match_extension(lower, extensions));

    for (const auto& suffix : table_.companion_suffixes) {
        if (!suffix.empty() && basename.size() > suffix.size() && ends_with(basename, suffix)) {
            basename.erase(basename.size() - suffix.size());
            break;
        }
    }
    return basename;
}

bool PathClassifier::is_header(const std::filesystem::path& path) const {
    return classify(path) == FileRole::HEADER;
}

bool PathClassifier::is_source(const std::filesystem::path& path) const {
    return classify(path) == FileRole::SOURCE;
}

std::string_view to_string(FileRole role) {
    switch (role) {
        case FileRole::HEADER:
            return "header";
        case FileRole::SOURCE:
            return "source";
        case FileRole::OTHER:
        default:
            return "other";
    }
}

FileRole role_from_string(std::string_view name) {
    std::string lower_name = to_lower(name);

    if (lower_name == "header" || lower_name == "h") {
        return FileRole::HEADER;
    }
    if (lower_name == "source" || lower_name == "src" || lower_name == "implementation") {
        return FileRole::SOURCE;
    }
    return FileRole::OTHER;
}

}  // namespace companion_mcp
