#include <boost/asio.hpp>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "ExampleApp.hpp"
#include "Router.hpp"
#include "Server.hpp"
#include "StaticFiles.hpp"
#include "TemplateRenderer.hpp"
#include "config.hpp"

// --- LOGGER INCLUDES ---
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

namespace net = boost::asio;

void setup_logging(const minnow::LoggingConfig& cfg) {
    // 1. Create a list of sinks
    std::vector<spdlog::sink_ptr> sinks;

    // 2. Create the Console Sink
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(spdlog::level::from_str(cfg.level));  // CONSOLE_LEVEL
    sinks.push_back(console_sink);

    // 3. Create a Rotating File Sink (an empty path disables it)
    if (!cfg.file.empty()) {
        constexpr size_t ONE_KILOBYTE = 1024;
        constexpr size_t MAX_LOG_FILE_SIZE_MB = 5;  // Maximum log file size in MB
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            cfg.file, ONE_KILOBYTE * ONE_KILOBYTE * MAX_LOG_FILE_SIZE_MB, 3);
        file_sink->set_level(spdlog::level::trace);  // FILE_LEVEL
        sinks.push_back(file_sink);
    }

    // 4. Create and register the logger
    auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    // 5. Set global levels and format
    spdlog::set_level(spdlog::level::trace);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");

    spdlog::flush_every(std::chrono::seconds(1));
}

int main(int argc, char* argv[]) {
    try {
        // --- 1. Argument Validation ---
        if (argc > 2) {
            spdlog::critical("Usage: minnow_server [config.toml]");
            return EXIT_FAILURE;
        }

        // --- 2. Configuration + logging ---
        const std::string config_path = argc == 2 ? argv[1] : "config.toml";
        minnow::AppConfig config = minnow::LoadConfig(config_path);
        setup_logging(config.logging);

        // --- 3. Application Core Components ---
        auto templates = std::make_shared<minnow::Templates>();
        if (std::filesystem::is_directory(config.paths.template_dir)) {
            templates->configure(
                std::make_shared<minnow::FileTemplateRenderer>(config.paths.template_dir));
        } else {
            spdlog::warn("Template directory '{}' missing, rendering disabled.",
                         config.paths.template_dir);
        }

        auto router = std::make_shared<minnow::Router>();
        minnow::app::RegisterExampleRoutes(
            *router, minnow::app::ExampleDeps{
                         std::make_shared<minnow::StaticFiles>(config.paths.static_dir), templates,
                         std::make_shared<minnow::app::PasteBoard>()});
        spdlog::debug("Router created.");

        // --- 4. Server ---
        net::io_context main_ioc;
        minnow::network::Server server(main_ioc, config, router);
        auto endpoint = server.local_endpoint();
        spdlog::info("Listening on {}:{}", endpoint.address().to_string(), endpoint.port());

        // Setup Graceful Shutdown
        net::signal_set signals(main_ioc, SIGINT, SIGTERM);
        signals.async_wait([&](auto, auto) {
            spdlog::info("Stop signal received...");
            server.Stop();
        });
        spdlog::trace("Signal set waiting for SIGINT/SIGTERM.");

        server.Start();

        // --- 5. Shutdown Complete ---
        spdlog::info("Server shutdown complete.");

    } catch (const std::exception& e) {
        spdlog::critical("Fatal Error: {}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
