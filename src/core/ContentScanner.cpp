#include "ContentScanner.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <system_error>

namespace companion_mcp {

namespace {

constexpr size_t kBinaryProbeSize = 8192;

bool looks_binary(std::ifstream& in) {
    std::string block(kBinaryProbeSize, '\0');
    in.read(block.data(), static_cast<std::streamsize>(block.size()));
    block.resize(static_cast<size_t>(in.gcount()));

    in.clear();
    in.seekg(0);
    return block.find('\0') != std::string::npos;
}

}  // namespace

void RecursiveContentScanner::scan(
    const std::filesystem::path& root,
    const std::regex& pattern,
    const FileFilter& filter,
    const CancellationToken& token,
    const MatchHandler& on_match
) {
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        throw ScanError("Search root is not a directory: " + root.string());
    }

    std::filesystem::recursive_directory_iterator it(
        root, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw ScanError("Cannot walk " + root.string() + ": " + ec.message());
    }

    size_t files_scanned = 0;
    for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            // A directory vanished mid-walk; report what was found so far
            spdlog::debug("Walk of {} stopped: {}", root.string(), ec.message());
            break;
        }
        if (token.is_cancelled()) {
            spdlog::debug("Scan of {} cancelled after {} files", root.string(), files_scanned);
            return;
        }

        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) {
            continue;
        }

        const auto& file = it->path();
        if (filter && !filter(file)) {
            continue;
        }

        ++files_scanned;
        if (!scan_file(file, pattern, token, on_match)) {
            return;
        }
    }

    spdlog::debug("Scan of {} complete, {} files read", root.string(), files_scanned);
}

bool RecursiveContentScanner::scan_file(
    const std::filesystem::path& file,
    const std::regex& pattern,
    const CancellationToken& token,
    const MatchHandler& on_match
) {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        spdlog::debug("Skipping unreadable file {}", file.string());
        return true;
    }
    if (looks_binary(in)) {
        return true;
    }

    std::string line;
    while (std::getline(in, line)) {
        if (token.is_cancelled()) {
            return false;
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        auto begin = line.find_first_not_of(" \t\f\v");
        if (begin == std::string::npos || line.size() - begin > kMaxLineLength) {
            continue;
        }
        line.erase(0, begin);

        if (std::regex_search(line, pattern) && !on_match(file, line)) {
            return false;
        }
    }
    return true;
}

} // namespace companion_mcp
