#include "FindSourceForHeaderTool.hpp"
#include <spdlog/spdlog.h>

namespace companion_mcp {

std::optional<std::filesystem::path> project_root_for(const json& args, const ResolverConfig& config) {
    if (args.contains("project_root")) {
        if (!args["project_root"].is_string()) {
            throw std::invalid_argument("project_root must be a string");
        }
        return std::filesystem::path(args["project_root"].get<std::string>());
    }
    if (!config.project_root.empty()) {
        return config.project_root;
    }
    return std::nullopt;
}

FindSourceForHeaderTool::FindSourceForHeaderTool(std::shared_ptr<CompanionResolver> resolver)
    : resolver_(std::move(resolver)) {
    if (!resolver_) {
        throw std::invalid_argument("Resolver cannot be null");
    }
}

ToolInfo FindSourceForHeaderTool::get_info() {
    return {
        "find_source_for_header",
        "Find the source file for a header: same directory first, then a search for "
        "source files that #include/#import the header",
        {
            {"type", "object"},
            {"properties", {
                {"header", {
                    {"type", "string"},
                    {"description", "Path of the header file (.h, .hpp, ...)"}
                }},
                {"project_root", {
                    {"type", "string"},
                    {"description", "Project root used to match root-relative includes "
                                    "(defaults to the server's project root; without one, include "
                                    "paths are resolved against the including file)"}
                }}
            }},
            {"required", json::array({"header"})}
        }
    };
}

json FindSourceForHeaderTool::execute(const json& args) {
    if (!args.contains("header") || !args["header"].is_string()) {
        return {
            {"error", "Missing required parameter: header"},
            {"success", false}
        };
    }

    std::string header = args["header"].get<std::string>();

    try {
        auto root = project_root_for(args, resolver_->config());
        spdlog::debug("FindSourceForHeaderTool: {} (root {})", header, root ? root->string() : "none");

        auto source = resolver_->find_source_for_header(header, root);
        return {
            {"success", true},
            {"header", header},
            {"source", source ? json(source->string()) : json(nullptr)}
        };
    } catch (const std::invalid_argument& e) {
        return {
            {"error", e.what()},
            {"success", false}
        };
    }
}

} // namespace companion_mcp
