#pragma once

#include "core/CompanionResolver.hpp"
#include "mcp/MCPServer.hpp"
#include <filesystem>
#include <memory>
#include <optional>

namespace companion_mcp {

/**
 * @brief MCP tool returning the source file that implements a header
 *
 * Looks in the header's directory first, then searches for a source file that
 * includes the header. The search is bounded by the configured timeout.
 */
class FindSourceForHeaderTool {
public:
    /**
     * @param resolver Companion resolver instance
     */
    explicit FindSourceForHeaderTool(std::shared_ptr<CompanionResolver> resolver);

    static ToolInfo get_info();

    /**
     * @brief Execute tool with arguments
     * @param args JSON object with "header" and optional "project_root"
     * @return JSON object with "source" (path or null)
     */
    json execute(const json& args);

private:
    std::shared_ptr<CompanionResolver> resolver_;
};

/**
 * @brief Project root for a tool request
 *
 * Order: "project_root" argument, then the configured project root. With
 * neither, std::nullopt: every include path is then resolved against the
 * file that contains it.
 *
 * @throws std::invalid_argument if "project_root" is present but not a string
 */
std::optional<std::filesystem::path> project_root_for(const json& args, const ResolverConfig& config);

} // namespace companion_mcp
