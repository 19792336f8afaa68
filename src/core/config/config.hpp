#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace minnow {

struct ServerConfig {
    std::string address = "0.0.0.0";
    uint16_t port = 8080;  // NOLINT
    unsigned int threads = 1;
    unsigned int idle_timeout_seconds = 15;  // NOLINT
};

struct SessionConfig {
    unsigned int timeout_seconds = 8 * 3600;    // NOLINT
    unsigned int sweep_interval_seconds = 300;  // NOLINT
};

struct PathsConfig {
    std::string static_dir = "static";
    std::string template_dir = "templates";
};

struct LoggingConfig {
    std::string level = "info";
    std::string file = "logs/server.log";
};

struct AppConfig {
    ServerConfig server;
    SessionConfig session;
    PathsConfig paths;
    LoggingConfig logging;
};

/**
 * @brief Loads configuration from a TOML file.
 * @param path Path to the .toml file (default: "config.toml")
 * @return Parsed AppConfig; defaults when the file does not exist.
 * @throws std::runtime_error if the file cannot be parsed or holds invalid values.
 */
AppConfig LoadConfig(const std::string& path = "config.toml");

// Same rules, from an in-memory TOML document.
AppConfig ParseConfig(std::string_view toml_text);

}  // namespace minnow
