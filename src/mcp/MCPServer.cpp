#include "MCPServer.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace companion_mcp {

MCPServer::MCPServer(std::unique_ptr<ITransport> transport,
                     std::string server_name,
                     std::string server_version)
    : transport_(std::move(transport)),
      server_name_(std::move(server_name)),
      server_version_(std::move(server_version)) {
    if (!transport_) {
        throw std::invalid_argument("Transport cannot be null");
    }
    spdlog::info("MCPServer initialized ({} {})", server_name_, server_version_);
}

void MCPServer::register_tool(const ToolInfo& info, ToolHandler handler) {
    if (info.name.empty()) {
        throw std::invalid_argument("Tool name cannot be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Tool handler cannot be null");
    }

    if (tools_.count(info.name) != 0) {
        spdlog::warn("Replacing tool: {}", info.name);
    }
    tools_[info.name] = info;
    handlers_[info.name] = std::move(handler);
    spdlog::info("Registered tool: {}", info.name);
}

void MCPServer::run() {
    running_ = true;
    spdlog::info("MCPServer starting main loop");

    while (running_ && transport_->is_open()) {
        json request = transport_->read_message();

        // Null or empty object means end of input
        if (request.is_null() || request.empty()) {
            spdlog::info("End of input, stopping server");
            break;
        }

        json response;
        try {
            response = handle_request(request);
        } catch (const std::exception& e) {
            spdlog::error("Unhandled error: {}", e.what());
            response = make_error(request.is_object() ? request.value("id", json()) : json(),
                                  rpc_error::kInternalError,
                                  std::string("Internal error: ") + e.what());
        }

        if (!response.is_null()) {
            transport_->write_message(response);
        }
    }

    running_ = false;
    spdlog::info("MCPServer stopped");
}

void MCPServer::stop() {
    spdlog::info("MCPServer stop requested");
    running_ = false;
}

json MCPServer::handle_request(const json& request) {
    if (!request.is_object() || request.value("jsonrpc", "") != "2.0") {
        return make_error(json(), rpc_error::kInvalidRequest,
                          "Invalid Request: missing or invalid jsonrpc field");
    }

    json id = request.value("id", json());
    const bool is_notification = !request.contains("id");

    if (!request.contains("method") || !request["method"].is_string()) {
        return make_error(id, rpc_error::kInvalidRequest, "Invalid Request: missing method field");
    }

    std::string method = request["method"];
    json params = request.value("params", json::object());

    spdlog::debug("Handling request: method={}, id={}", method, id.dump());

    if (method == "notifications/initialized") {
        spdlog::info("Client initialized, server is ready");
        return json();
    }
    if (is_notification && method.rfind("notifications/", 0) == 0) {
        spdlog::debug("Ignoring notification: {}", method);
        return json();
    }

    try {
        if (method == "initialize") {
            json result = handle_initialize(params);
            initialized_ = true;
            return make_result(id, std::move(result));
        }
        if (method == "ping") {
            return make_result(id, json::object());
        }
        if (method == "tools/list") {
            return make_result(id, handle_tools_list());
        }
        if (method == "tools/call") {
            if (!initialized_) {
                spdlog::debug("tools/call received before initialize");
            }
            return make_result(id, handle_tools_call(params));
        }
        return make_error(id, rpc_error::kMethodNotFound, "Method not found: " + method);
    } catch (const std::invalid_argument& e) {
        spdlog::warn("Invalid params for {}: {}", method, e.what());
        return make_error(id, rpc_error::kInvalidParams, std::string("Invalid params: ") + e.what());
    } catch (const std::exception& e) {
        spdlog::error("Error handling method {}: {}", method, e.what());
        return make_error(id, rpc_error::kInternalError, std::string("Internal error: ") + e.what());
    }
}

json MCPServer::handle_initialize(const json& params) {
    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        spdlog::info("Client: {} version {}",
                     params["clientInfo"].value("name", "unknown"),
                     params["clientInfo"].value("version", "unknown"));
    }

    return {
        {"protocolVersion", "2024-11-05"},
        {"capabilities", {
            {"tools", json::object()}
        }},
        {"serverInfo", {
            {"name", server_name_},
            {"version", server_version_}
        }}
    };
}

json MCPServer::handle_tools_list() const {
    json tools_array = json::array();

    for (const auto& [name, info] : tools_) {
        tools_array.push_back({
            {"name", info.name},
            {"description", info.description},
            {"inputSchema", info.input_schema}
        });
    }

    spdlog::debug("Returning {} tools", tools_array.size());
    return {{"tools", tools_array}};
}

json MCPServer::handle_tools_call(const json& params) {
    if (!params.contains("name") || !params["name"].is_string()) {
        throw std::invalid_argument("Missing required parameter: name");
    }

    std::string tool_name = params["name"];
    json arguments = params.value("arguments", json::object());

    auto handler_it = handlers_.find(tool_name);
    if (handler_it == handlers_.end()) {
        throw std::invalid_argument("Unknown tool: " + tool_name);
    }

    spdlog::debug("Calling tool: {} with args: {}", tool_name, arguments.dump());
    json result = handler_it->second(arguments);

    bool failed = result.is_object() && result.value("success", true) == false;
    return {
        {"content", json::array({
            {
                {"type", "text"},
                {"text", result.dump()}
            }
        })},
        {"isError", failed}
    };
}

json MCPServer::make_result(const json& id, json result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", std::move(result)}
    };
}

json MCPServer::make_error(const json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

} // namespace companion_mcp
