#include "FindIncludingSourceTool.hpp"
#include "FindSourceForHeaderTool.hpp"
#include <spdlog/spdlog.h>

namespace companion_mcp {

FindIncludingSourceTool::FindIncludingSourceTool(std::shared_ptr<CompanionResolver> resolver)
    : resolver_(std::move(resolver)) {
    if (!resolver_) {
        throw std::invalid_argument("Resolver cannot be null");
    }
}

ToolInfo FindIncludingSourceTool::get_info() {
    return {
        "find_including_source",
        "Search for a source file that #include/#import's a header, either by a path relative "
        "to the project root or by a path relative to the including file",
        {
            {"type", "object"},
            {"properties", {
                {"header", {
                    {"type", "string"},
                    {"description", "Path of the header file"}
                }},
                {"project_root", {
                    {"type", "string"},
                    {"description", "Project root used to match root-relative includes"}
                }},
                {"timeout_ms", {
                    {"type", "integer"},
                    {"minimum", 1},
                    {"description", "Give up after this many milliseconds (defaults to the server timeout)"}
                }}
            }},
            {"required", json::array({"header"})}
        }
    };
}

json FindIncludingSourceTool::execute(const json& args) {
    if (!args.contains("header") || !args["header"].is_string()) {
        return {
            {"error", "Missing required parameter: header"},
            {"success", false}
        };
    }

    std::string header = args["header"].get<std::string>();

    auto timeout = resolver_->config().search_timeout;
    if (args.contains("timeout_ms")) {
        if (!args["timeout_ms"].is_number_integer() || args["timeout_ms"].get<long long>() <= 0) {
            return {
                {"error", "timeout_ms must be a positive integer"},
                {"success", false}
            };
        }
        timeout = std::chrono::milliseconds(args["timeout_ms"].get<long long>());
    }

    try {
        auto root = project_root_for(args, resolver_->config());
        auto handle = resolver_->find_including_source_file(header, root);

        if (!handle.wait_for(timeout)) {
            handle.cancel();
            spdlog::info("FindIncludingSourceTool: search for {} timed out", header);
            return {
                {"success", true},
                {"header", header},
                {"source", nullptr},
                {"timed_out", true}
            };
        }

        auto source = handle.get();
        return {
            {"success", true},
            {"header", header},
            {"source", source ? json(source->string()) : json(nullptr)},
            {"timed_out", false}
        };
    } catch (const std::invalid_argument& e) {
        return {
            {"error", e.what()},
            {"success", false}
        };
    } catch (const ScanError& e) {
        spdlog::warn("FindIncludingSourceTool: {}", e.what());
        return {
            {"error", e.what()},
            {"success", false}
        };
    }
}

} // namespace companion_mcp
