#include "core/CompanionResolver.hpp"
#include "core/ResolverConfig.hpp"
#include "mcp/MCPServer.hpp"
#include "mcp/StdioTransport.hpp"
#include "tools/FindHeaderForSourceTool.hpp"
#include "tools/FindSourceForHeaderTool.hpp"
#include "tools/FindIncludingSourceTool.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <csignal>
#include <memory>
#include <atomic>

namespace {
    std::atomic<bool> shutdown_requested{false};
    companion_mcp::MCPServer* global_server = nullptr;

    void signal_handler(int signal) {
        shutdown_requested = true;
        if (global_server) {
            global_server->stop();
        }
        (void)signal;
    }

    void setup_signal_handlers() {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
    }
}

int main(int argc, char** argv) {
    CLI::App app{"Companion file MCP server - find the header of a source file and the source of a header"};

    std::string log_level = "info";
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error, critical)")
        ->default_val("info");

    std::string config_file;
    app.add_option("-c,--config", config_file, "JSON configuration file")
        ->check(CLI::ExistingFile);

    std::string project_root;
    app.add_option("-r,--project-root", project_root, "Default project root for include searches")
        ->check(CLI::ExistingDirectory);

    long long timeout_ms = 0;
    app.add_option("-t,--timeout-ms", timeout_ms, "Include search timeout in milliseconds (default 15000)")
        ->check(CLI::PositiveNumber);

    std::string search_scope;
    app.add_option("-s,--search-scope", search_scope, "Include search tree: header_directory or project_root")
        ->check(CLI::IsMember({"header_directory", "project_root"}));

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << "companion-mcp version 1.0.0" << std::endl;
        return 0;
    }

    // stdout carries the protocol, so logs go to stderr
    spdlog::set_default_logger(spdlog::stderr_color_mt("companion-mcp"));

    auto level = spdlog::level::from_str(log_level);
    if (level == spdlog::level::off && log_level != "off") {
        std::cerr << "Invalid log level: " << log_level << std::endl;
        return 1;
    }
    spdlog::set_level(level);

    spdlog::info("Starting companion MCP server");
    spdlog::info("Log level: {}", log_level);

    try {
        companion_mcp::ResolverConfig config;
        if (!config_file.empty()) {
            config = companion_mcp::ResolverConfig::load(config_file);
        }
        if (!project_root.empty()) {
            config.project_root = project_root;
        }
        if (timeout_ms > 0) {
            config.search_timeout = std::chrono::milliseconds(timeout_ms);
        }
        if (!search_scope.empty()) {
            config.search_scope = companion_mcp::scope_from_string(search_scope);
        }
        config.validate();

        spdlog::info("Search timeout: {} ms, scope: {}", config.search_timeout.count(),
                     companion_mcp::to_string(config.search_scope));

        setup_signal_handlers();

        auto resolver = std::make_shared<companion_mcp::CompanionResolver>(config);
        auto transport = std::make_unique<companion_mcp::StdioTransport>();
        auto server = std::make_unique<companion_mcp::MCPServer>(std::move(transport));

        global_server = server.get();

        auto header_tool = std::make_shared<companion_mcp::FindHeaderForSourceTool>(resolver);
        server->register_tool(
            companion_mcp::FindHeaderForSourceTool::get_info(),
            [header_tool](const nlohmann::json& args) {
                return header_tool->execute(args);
            }
        );

        auto source_tool = std::make_shared<companion_mcp::FindSourceForHeaderTool>(resolver);
        server->register_tool(
            companion_mcp::FindSourceForHeaderTool::get_info(),
            [source_tool](const nlohmann::json& args) {
                return source_tool->execute(args);
            }
        );

        auto including_tool = std::make_shared<companion_mcp::FindIncludingSourceTool>(resolver);
        server->register_tool(
            companion_mcp::FindIncludingSourceTool::get_info(),
            [including_tool](const nlohmann::json& args) {
                return including_tool->execute(args);
            }
        );

        spdlog::info("All tools registered, starting server");

        server->run();

        global_server = nullptr;
        spdlog::info("Server stopped{}", shutdown_requested ? " on signal" : "");
        return 0;

    } catch (const companion_mcp::ConfigError& e) {
        spdlog::critical("Configuration error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
