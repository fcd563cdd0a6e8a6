#include "DirectoryProber.hpp"
#include <spdlog/spdlog.h>
#include <system_error>

namespace companion_mcp {

std::optional<std::filesystem::path> DirectoryProber::probe(
    const std::filesystem::path& dir,
    const std::string& basename,
    FileRole role,
    const PathClassifier& classifier
) {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        spdlog::debug("Cannot list directory {}: {}", dir.string(), ec.message());
        return std::nullopt;
    }

    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            spdlog::debug("Stopped listing {}: {}", dir.string(), ec.message());
            break;
        }

        const auto& entry_path = it->path();

        // Role and basename are pure string checks; do them before stat()
        if (classifier.classify(entry_path) != role ||
            classifier.basename_of(entry_path) != basename) {
            continue;
        }

        std::error_code type_ec;
        if (it->is_directory(type_ec)) {
            continue;
        }

        spdlog::debug("Probe hit in {}: {}", dir.string(), entry_path.filename().string());
        return entry_path;
    }

    return std::nullopt;
}

} // namespace companion_mcp
