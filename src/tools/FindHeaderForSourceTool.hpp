#pragma once

#include "core/CompanionResolver.hpp"
#include "mcp/MCPServer.hpp"
#include <memory>

namespace companion_mcp {

/**
 * @brief MCP tool returning the header that belongs to a source file
 *
 * Looks in the source's own directory, then in framework Headers/PrivateHeaders folders.
 */
class FindHeaderForSourceTool {
public:
    /**
     * @param resolver Companion resolver instance
     */
    explicit FindHeaderForSourceTool(std::shared_ptr<CompanionResolver> resolver);

    /**
     * @brief Get tool metadata and JSON schema
     */
    static ToolInfo get_info();

    /**
     * @brief Execute tool with arguments
     * @param args JSON object with "source" parameter
     * @return JSON object with "header" (path or null)
     */
    json execute(const json& args);

private:
    std::shared_ptr<CompanionResolver> resolver_;
};

} // namespace companion_mcp
