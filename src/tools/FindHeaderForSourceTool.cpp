#include "FindHeaderForSourceTool.hpp"
#include <spdlog/spdlog.h>

namespace companion_mcp {

FindHeaderForSourceTool::FindHeaderForSourceTool(std::shared_ptr<CompanionResolver> resolver)
    : resolver_(std::move(resolver)) {
    if (!resolver_) {
        throw std::invalid_argument("Resolver cannot be null");
    }
}

ToolInfo FindHeaderForSourceTool::get_info() {
    return {
        "find_header_for_source",
        "Find the header file for a C/C++/Objective-C source file (same directory, "
        "then framework Headers/PrivateHeaders folders)",
        {
            {"type", "object"},
            {"properties", {
                {"source", {
                    {"type", "string"},
                    {"description", "Path of the source file (.c, .cpp, .m, ...)"}
                }}
            }},
            {"required", json::array({"source"})}
        }
    };
}

json FindHeaderForSourceTool::execute(const json& args) {
    if (!args.contains("source") || !args["source"].is_string()) {
        return {
            {"error", "Missing required parameter: source"},
            {"success", false}
        };
    }

    std::string source = args["source"].get<std::string>();
    spdlog::debug("FindHeaderForSourceTool: {}", source);

    try {
        auto header = resolver_->find_header_for_source(source);
        return {
            {"success", true},
            {"source", source},
            {"header", header ? json(header->string()) : json(nullptr)}
        };
    } catch (const std::invalid_argument& e) {
        return {
            {"error", e.what()},
            {"success", false}
        };
    }
}

} // namespace companion_mcp
