#include "CompanionResolver.hpp"
#include "DirectoryProber.hpp"
#include "FrameworkStructure.hpp"
#include <spdlog/spdlog.h>
#include <system_error>

namespace companion_mcp {

CompanionResolver::CompanionResolver(ResolverConfig config)
    : CompanionResolver(std::move(config), std::make_shared<RecursiveContentScanner>()) {
}

CompanionResolver::CompanionResolver(ResolverConfig config, std::shared_ptr<IContentScanner> scanner)
    : config_(std::move(config)),
      classifier_(config_.extensions),
      include_search_(classifier_, std::move(scanner), config_.search_scope) {
    config_.validate();
}

std::optional<std::filesystem::path> CompanionResolver::find_header_for_source(
    const std::filesystem::path& source
) const {
    auto source_path = normalize_input_path(source, "source", true);

    auto header = DirectoryProber::probe(
        source_path.parent_path(),
        classifier_.basename_of(source_path),
        FileRole::HEADER,
        classifier_
    );
    if (header) {
        return header;
    }

    // Special case for frameworks: Sources/<Name>/... next to Headers/ and PrivateHeaders/
    return find_header_in_framework(source_path);
}

std::optional<std::filesystem::path> CompanionResolver::find_header_in_framework(
    const std::filesystem::path& source
) const {
    auto structure = framework_structure_for(source.parent_path());
    if (!structure) {
        return std::nullopt;
    }

    spdlog::debug("{} is in framework {} at {}", source.filename().string(),
                  structure->framework_name, structure->framework_path.string());

    std::string basename = classifier_.basename_of(source);
    for (const auto& dir : header_search_dirs(*structure)) {
        if (auto header = DirectoryProber::probe(dir, basename, FileRole::HEADER, classifier_)) {
            return header;
        }
    }
    return std::nullopt;
}

std::optional<std::filesystem::path> CompanionResolver::find_source_for_header(
    const std::filesystem::path& header,
    const std::optional<std::filesystem::path>& project_root
) const {
    auto header_path = normalize_input_path(header, "header", true);
    auto root = normalize_project_root(project_root);

    auto source = DirectoryProber::probe(
        header_path.parent_path(),
        classifier_.basename_of(header_path),
        FileRole::SOURCE,
        classifier_
    );
    if (source) {
        return source;
    }

    // Fall back to searching for a source file that includes the header
    try {
        auto handle = include_search_.start(header_path, root);
        if (!handle.wait_for(config_.search_timeout)) {
            spdlog::info("Include search for {} timed out after {} ms",
                         header_path.string(), config_.search_timeout.count());
            handle.cancel();
            return std::nullopt;
        }
        return handle.get();
    } catch (const ScanError& e) {
        spdlog::warn("Include search for {} failed: {}", header_path.string(), e.what());
    } catch (const std::system_error& e) {
        spdlog::warn("Cannot run include search for {}: {}", header_path.string(), e.what());
    }
    return std::nullopt;
}

std::future<std::optional<std::filesystem::path>> CompanionResolver::find_source_for_header_async(
    const std::filesystem::path& header,
    const std::optional<std::filesystem::path>& project_root
) const {
    auto header_path = normalize_input_path(header, "header", true);
    auto root = normalize_project_root(project_root);

    return std::async(
        std::launch::async,
        [resolver = *this, header_path, root]() {
            return resolver.find_source_for_header(header_path, root);
        }
    );
}

SearchHandle CompanionResolver::find_including_source_file(
    const std::filesystem::path& header,
    const std::optional<std::filesystem::path>& project_root
) const {
    return include_search_.start(header, project_root);
}

} // namespace companion_mcp
