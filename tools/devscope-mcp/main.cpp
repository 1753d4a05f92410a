#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

#include <CLI/CLI.hpp>

#include <devscope/config/server_config.h>
#include <devscope/integration/browser_driver.h>
#include <devscope/integration/introspection_backend.h>
#include <devscope/mcp/mcp_server.h>
#include <devscope/mcp/tool_catalog.h>
#include <devscope/streaming/session_manager.h>

#include <unistd.h>

std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

int main(int argc, char* argv[]) {
    using namespace devscope;

    CLI::App app{"devscope MCP server - developer tooling over JSON-RPC on stdio"};

    std::string config_path;
    std::string log_level;
    std::string log_file;
    std::size_t workers = 0;
    std::string output_framing;
    std::string browser_command;
    std::string analyzer_command;
    std::string project_root;

    app.add_option("--config", config_path,
                   "Config file (default: $XDG_CONFIG_HOME/devscope/config.toml)");
    auto* levelOpt =
        app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error)")
            ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));
    app.add_option("--log-file", log_file, "Log file path (optional)");
    auto* workersOpt = app.add_option("--workers", workers, "Worker threads (0 = auto)");
    auto* framingOpt =
        app.add_option("--output-framing", output_framing,
                       "Output framing: ndjson|content-length|mirror")
            ->check(CLI::IsMember({"ndjson", "content-length", "mirror"}));
    auto* browserOpt =
        app.add_option("--browser-command", browser_command, "Browser driver command line");
    auto* analyzerOpt =
        app.add_option("--analyzer-command", analyzer_command, "Analyzer command line");
    auto* rootOpt = app.add_option("--project-root", project_root, "Project root directory");
    CLI11_PARSE(app, argc, argv);

    auto loaded = config::loadServerConfig(config_path);
    if (!loaded) {
        std::cerr << "Configuration error: " << loaded.error().message << std::endl;
        return 2;
    }
    auto cfg = std::move(loaded).value();

    // Command line flags win over the environment and the config file
    if (levelOpt->count() > 0)
        cfg.logLevel = log_level;
    if (workersOpt->count() > 0)
        cfg.workerThreads = workers;
    if (framingOpt->count() > 0)
        cfg.outputFraming = output_framing;
    if (browserOpt->count() > 0)
        cfg.browserCommand = browser_command;
    if (analyzerOpt->count() > 0)
        cfg.analyzerCommand = analyzer_command;
    if (rootOpt->count() > 0)
        cfg.projectRoot = config::expand_tilde(project_root);
    if (auto valid = cfg.validate(); !valid) {
        std::cerr << "Configuration error: " << valid.error().message << std::endl;
        return 2;
    }

    try {
        // stdout carries protocol traffic; logs go to stderr and the optional file
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (!log_file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, 10 * 1024 * 1024, 3));
        }

        auto logger = std::make_shared<spdlog::logger>("devscope-mcp", sinks.begin(), sinks.end());
        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::from_str(cfg.logLevel));
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
    } catch (const std::exception& e) {
        std::cerr << "Failed to setup logging: " << e.what() << std::endl;
        return 1;
    }

    spdlog::info("devscope MCP server v{}", DEVSCOPE_VERSION_STRING);
    if (!cfg.configPath.empty()) {
        spdlog::info("Config: {}", cfg.configPath.string());
    }
    spdlog::info("Transport: STDIO ({} output)", cfg.outputFraming);
    spdlog::info("Project root: {}", cfg.projectRoot.string());

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        std::shared_ptr<integration::IBrowserDriver> browser;
        if (cfg.browserCommand.empty()) {
            spdlog::warn("No browser driver configured; UI tools will report errors");
            browser = std::make_shared<integration::UnavailableBrowserDriver>();
        } else {
            browser = std::make_shared<integration::CommandBrowserDriver>(cfg.browserCommand,
                                                                          cfg.browserTimeout);
        }

        std::shared_ptr<integration::IIntrospectionBackend> analyzer;
        if (cfg.analyzerCommand.empty()) {
            spdlog::warn("No analyzer configured; informational tools will report errors");
            analyzer = std::make_shared<integration::UnavailableIntrospectionBackend>();
        } else {
            analyzer = std::make_shared<integration::CommandIntrospectionBackend>(
                cfg.analyzerCommand, cfg.projectRoot, cfg.analyzerTimeout);
        }

        streaming::StreamingOptions streamingOptions;
        streamingOptions.adaptiveThreshold = cfg.adaptiveThreshold;
        streamingOptions.idleTimeout = cfg.idleTimeout;
        streamingOptions.retiredRetention = cfg.retiredRetention;
        auto sessions =
            std::make_shared<streaming::StreamingSessionManager>(browser, streamingOptions);

        auto registry = mcp::buildToolRegistry({sessions, browser, analyzer}, cfg);
        if (!registry) {
            spdlog::error("Failed to build tool catalog: {}", registry.error().message);
            return 1;
        }

        mcp::StdioTransport::Options transportOptions;
        transportOptions.outputFraming =
            mcp::parseOutputFraming(cfg.outputFraming).value_or(mcp::OutputFraming::Ndjson);
        transportOptions.maxMessageBytes = cfg.maxMessageBytes;
        transportOptions.pollFd = STDIN_FILENO;
        std::unique_ptr<mcp::ITransport> transport =
            std::make_unique<mcp::StdioTransport>(transportOptions);

        mcp::ServerOptions serverOptions;
        serverOptions.workerThreads = cfg.effectiveWorkerThreads();
        serverOptions.sweepInterval = cfg.sweepInterval;

        auto server = std::make_unique<mcp::MCPServer>(std::move(transport),
                                                       std::move(registry).value(), sessions,
                                                       serverOptions, &g_running);

        std::thread server_thread([&server]() {
            server->start();
            // Input ended on its own
            g_running = false;
        });

        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        spdlog::info("Shutting down MCP server...");
        server->stop();
        if (server_thread.joinable()) {
            server_thread.join();
        }
        spdlog::info("MCP server stopped");
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
    return 0;
}
