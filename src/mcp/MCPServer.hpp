#pragma once

#include "ITransport.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace companion_mcp {

using json = nlohmann::json;

/**
 * @brief Metadata for an MCP tool
 */
struct ToolInfo {
    std::string name;
    std::string description;
    json input_schema;  // JSON Schema for tool arguments
};

/**
 * @brief Tool entry point
 *
 * Returns a JSON object; a "success": false member marks the call as failed.
 * Throwing std::invalid_argument is reported as invalid params.
 */
using ToolHandler = std::function<json(const json& args)>;

/**
 * @brief JSON-RPC error codes used by the server
 */
namespace rpc_error {
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
}  // namespace rpc_error

/**
 * @brief MCP server implementing JSON-RPC 2.0
 *
 * Methods: initialize, notifications/initialized, ping, tools/list, tools/call.
 * Requests are handled one at a time in arrival order.
 */
class MCPServer {
public:
    /**
     * @param transport Message channel (must not be null)
     * @param server_name Reported in the initialize response
     * @param server_version Reported in the initialize response
     */
    explicit MCPServer(std::unique_ptr<ITransport> transport,
                       std::string server_name = "companion-mcp",
                       std::string server_version = "1.0.0");

    /**
     * @brief Register a tool; a tool with the same name is replaced
     * @throws std::invalid_argument on empty name or null handler
     */
    void register_tool(const ToolInfo& info, ToolHandler handler);

    /**
     * @brief Serve requests until stop() is called or the transport closes
     */
    void run();

    /**
     * @brief Signal the main loop to stop after the current request
     */
    void stop();

    size_t tool_count() const { return tools_.size(); }

private:
    /**
     * @brief Dispatch one message
     * @return Response, or null JSON for notifications
     */
    json handle_request(const json& request);

    json handle_initialize(const json& params);
    json handle_tools_list() const;

    /**
     * @brief Run a tool and wrap its JSON result as MCP text content
     * @throws std::invalid_argument for a missing or unknown tool name
     */
    json handle_tools_call(const json& params);

    static json make_result(const json& id, json result);
    static json make_error(const json& id, int code, const std::string& message);

    std::unique_ptr<ITransport> transport_;
    std::string server_name_;
    std::string server_version_;
    std::map<std::string, ToolInfo> tools_;
    std::map<std::string, ToolHandler> handlers_;
    std::atomic<bool> running_{false};
    bool initialized_{false};
};

} // namespace companion_mcp
