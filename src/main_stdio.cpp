#include "core/Errors.hpp"
#include "core/ServerConfig.hpp"
#include "core/Version.hpp"
#include "mcp/Dispatcher.hpp"
#include "mcp/MCPServer.hpp"
#include "mcp/StdioTransport.hpp"
#include "tools/ToolCatalog.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>

namespace {
    std::atomic<presence_mcp::MCPServer*> global_server{nullptr};

    void signal_handler(int /*signal*/) {
        if (presence_mcp::MCPServer* server = global_server.load()) {
            server->stop();
        }
    }

    void setup_signal_handlers() {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
    }
}

int main(int argc, char** argv) {
    // Parse command-line arguments
    CLI::App app{"MCP Stdio Server - AI brand presence audits"};

    presence_mcp::ServerConfig config;
    app.add_option("-l,--log-level", config.log_level,
                   "Log level (trace, debug, info, warn, error, critical, off)")
        ->default_val("info");
    app.add_option("--log-file", config.log_file, "Write logs to this file instead of stderr");
    app.add_flag("--require-initialize", config.require_initialize,
                 "Reject tools/call until the client has sent initialize");
    app.add_option("--max-frame-bytes", config.max_frame_bytes, "Largest accepted request line in bytes")
        ->default_val(config.max_frame_bytes);

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << presence_mcp::kServerName << " version " << presence_mcp::kServerVersion << std::endl;
        return 0;
    }

    try {
        config.validate();
        presence_mcp::configure_logging(config);
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    spdlog::info("Starting {} {}", presence_mcp::kServerName, presence_mcp::kServerVersion);
    spdlog::info("Log level: {}", config.log_level);

    try {
        // Setup signal handlers for graceful shutdown
        setup_signal_handlers();

        // The registry outlives the dispatcher that reads it
        const presence_mcp::ToolRegistry registry = presence_mcp::build_tool_registry();

        presence_mcp::DispatcherOptions options;
        options.handshake_policy = config.require_initialize
            ? presence_mcp::HandshakePolicy::Strict
            : presence_mcp::HandshakePolicy::Permissive;

        auto transport = std::make_unique<presence_mcp::StdioTransport>(
            std::cin, std::cout, config.max_frame_bytes);
        auto server = std::make_unique<presence_mcp::MCPServer>(
            std::move(transport), presence_mcp::Dispatcher(registry, options));

        // Store global reference for signal handler
        global_server = server.get();

        // Run server (blocks until stopped)
        server->run();

        global_server = nullptr;
        spdlog::info("Server stopped cleanly");
        return 0;

    } catch (const presence_mcp::RegistryError& e) {
        spdlog::critical("Tool registry construction failed: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
