#pragma once

#include "core/CompanionResolver.hpp"
#include "mcp/MCPServer.hpp"
#include <memory>

namespace companion_mcp {

/**
 * @brief MCP tool running only the include search for a header
 *
 * Unlike find_source_for_header it skips the same-directory lookup, accepts a
 * per-call timeout and reports whether the search timed out or failed.
 */
class FindIncludingSourceTool {
public:
    explicit FindIncludingSourceTool(std::shared_ptr<CompanionResolver> resolver);

    static ToolInfo get_info();

    /**
     * @brief Execute tool with arguments
     * @param args JSON object with "header", optional "project_root" and "timeout_ms"
     * @return JSON object with "source" (path or null) and "timed_out"
     */
    json execute(const json& args);

private:
    std::shared_ptr<CompanionResolver> resolver_;
};

} // namespace companion_mcp
