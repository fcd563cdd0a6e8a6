#include "IncludeSearch.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <system_error>

namespace companion_mcp {

std::string_view to_string(SearchScope scope) {
    switch (scope) {
        case SearchScope::PROJECT_ROOT:
            return "project_root";
        case SearchScope::HEADER_DIRECTORY:
        default:
            return "header_directory";
    }
}

SearchScope scope_from_string(std::string_view name) {
    if (name == "header_directory") {
        return SearchScope::HEADER_DIRECTORY;
    }
    if (name == "project_root") {
        return SearchScope::PROJECT_ROOT;
    }
    throw std::invalid_argument("Unknown search scope: " + std::string(name));
}

std::filesystem::path normalize_input_path(const std::filesystem::path& path,
                                           std::string_view what,
                                           bool require_filename) {
    const std::string name(what);
    if (path.empty()) {
        throw std::invalid_argument(name + " path is empty");
    }
    if (path.native().find('\0') != std::filesystem::path::string_type::npos) {
        throw std::invalid_argument(name + " path contains a NUL character");
    }

    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        throw std::invalid_argument(name + " path cannot be made absolute: " + ec.message());
    }
    auto normal = absolute.lexically_normal();

    if (require_filename) {
        auto filename = path.filename();
        if (filename.empty() || filename == "." || filename == "..") {
            throw std::invalid_argument(name + " path does not name a file: " + path.string());
        }
    } else if (!normal.has_filename() && normal.has_relative_path()) {
        // "/a/b/" -> "/a/b"
        normal = normal.parent_path();
    }
    return normal;
}

std::optional<std::filesystem::path> normalize_project_root(
    const std::optional<std::filesystem::path>& project_root) {
    if (!project_root) {
        return std::nullopt;
    }
    return normalize_input_path(*project_root, "project_root", false);
}

// ---------------------------------------------------------------------------
// SearchHandle
// ---------------------------------------------------------------------------

SearchHandle::SearchHandle(std::shared_ptr<CancellationToken> token,
                           std::future<std::optional<std::filesystem::path>> result)
    : token_(std::move(token)), result_(std::move(result)) {
    if (!token_) {
        throw std::invalid_argument("Cancellation token cannot be null");
    }
}

SearchHandle::~SearchHandle() {
    if (token_) {
        token_->cancel();
    }
    if (result_.valid()) {
        result_.wait();
    }
}

void SearchHandle::cancel() {
    if (token_) {
        token_->cancel();
    }
}

bool SearchHandle::wait_for(std::chrono::milliseconds timeout) const {
    if (!result_.valid()) {
        return true;
    }
    return result_.wait_for(timeout) == std::future_status::ready;
}

std::optional<std::filesystem::path> SearchHandle::get() {
    return result_.get();
}

// ---------------------------------------------------------------------------
// IncludeSearch
// ---------------------------------------------------------------------------

IncludeSearch::IncludeSearch(PathClassifier classifier,
                             std::shared_ptr<IContentScanner> scanner,
                             SearchScope scope)
    : classifier_(std::move(classifier)), scanner_(std::move(scanner)), scope_(scope) {
    if (!scanner_) {
        throw std::invalid_argument("Content scanner cannot be null");
    }
}

std::string IncludeSearch::escape_regex(std::string_view text) {
    static const std::string special = "\\^$.|?*+()[]{}";

    std::string escaped;
    escaped.reserve(text.size() * 2);
    for (char c : text) {
        if (special.find(c) != std::string::npos) {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

std::string IncludeSearch::build_include_pattern(const std::filesystem::path& header,
                                                 const std::filesystem::path& project_root) {
    std::string basename = header.filename().generic_string();

    auto relative = header.lexically_relative(project_root);
    std::string root_relative = relative.empty() ? basename : relative.generic_string();

    // Group 1: project-root relative path. Group 2: any path ending in the
    // header's file name ("x.h", "../../x.h", "sub/x.h"), checked later by
    // resolving it against the including file.
    return R"(^\s*#\s*(?:include|import)\s*["<](?:()" + escape_regex(root_relative) +
           R"()|((?:[^"<>]*/)?)" + escape_regex(basename) +
           R"())[">]\s*$)";
}

bool IncludeSearch::accept_match(const std::filesystem::path& file,
                                 const std::string& line,
                                 const std::filesystem::path& header,
                                 const std::regex& include_regex,
                                 bool trust_root_relative) const {
    if (!classifier_.is_source(file)) {
        return false;
    }

    // Cheap pre-filter so the regex only ever sees a short directive
    auto begin = line.find_first_not_of(" \t\f\v");
    if (begin == std::string::npos || line[begin] != '#' ||
        line.size() - begin > kMaxDirectiveLength) {
        return false;
    }
    const std::string directive = line.substr(begin);

    std::smatch match;
    if (!std::regex_search(directive, match, include_regex)) {
        return false;
    }

    if (match[1].matched && trust_root_relative) {
        return true;
    }

    const auto& captured = match[1].matched ? match[1] : match[2];
    if (captured.matched) {
        auto resolved = (file.parent_path() / captured.str()).lexically_normal();
        if (resolved == header) {
            return true;
        }
        spdlog::trace("Rejected {}: '{}' resolves to {}", file.string(), captured.str(), resolved.string());
    }
    return false;
}

std::filesystem::path IncludeSearch::search_root(
    const std::filesystem::path& header,
    const std::optional<std::filesystem::path>& project_root
) const {
    if (scope_ == SearchScope::PROJECT_ROOT && project_root) {
        return *project_root;
    }
    return header.parent_path();
}

std::optional<std::filesystem::path> IncludeSearch::find_including_source_file(
    const std::filesystem::path& header,
    const std::optional<std::filesystem::path>& project_root,
    const CancellationToken& token
) const {
    auto header_path = normalize_input_path(header, "header", true);
    auto root = normalize_project_root(project_root);

    // Without a project root, root-relative includes are resolved like relative ones
    const bool trust_root_relative = root.has_value();
    std::regex include_regex(build_include_pattern(header_path, root.value_or(header_path.parent_path())),
                             std::regex::ECMAScript | std::regex::optimize);
    auto dir = search_root(header_path, root);

    spdlog::debug("Searching {} for files including {}", dir.string(), header_path.string());

    std::optional<std::filesystem::path> found;
    scanner_->scan(
        dir,
        include_regex,
        [this](const std::filesystem::path& file) { return classifier_.is_source(file); },
        token,
        [&](const std::filesystem::path& file, const std::string& line) {
            if (!accept_match(file, line, header_path, include_regex, trust_root_relative)) {
                return true;
            }
            found = file;
            return false;
        }
    );

    if (found) {
        spdlog::debug("Found {} including {}", found->string(), header_path.string());
    } else if (token.is_cancelled()) {
        spdlog::debug("Include search for {} cancelled", header_path.string());
    }
    return found;
}

SearchHandle IncludeSearch::start(const std::filesystem::path& header,
                                  const std::optional<std::filesystem::path>& project_root) const {
    auto header_path = normalize_input_path(header, "header", true);
    auto root = normalize_project_root(project_root);

    auto token = std::make_shared<CancellationToken>();
    auto result = std::async(
        std::launch::async,
        [search = *this, header_path, root, token]() {
            return search.find_including_source_file(header_path, root, *token);
        }
    );
    return SearchHandle(token, std::move(result));
}

} // namespace companion_mcp
