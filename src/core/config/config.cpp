#include "config.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <stdexcept>
#include <toml++/toml.hpp>

namespace minnow {

namespace {

AppConfig FromTable(const toml::table& tbl) {
    AppConfig config;

    // 1. Server Settings
    if (auto server = tbl["server"]) {
        config.server.address = server["address"].value_or(config.server.address);
        config.server.port = server["port"].value_or<uint16_t>(config.server.port);
        config.server.threads = server["threads"].value_or<unsigned int>(config.server.threads);
        config.server.idle_timeout_seconds = server["idle_timeout_seconds"].value_or<unsigned int>(
            config.server.idle_timeout_seconds);
    }

    // 2. Sessions
    if (auto session = tbl["session"]) {
        config.session.timeout_seconds =
            session["timeout_seconds"].value_or<unsigned int>(config.session.timeout_seconds);
        config.session.sweep_interval_seconds = session["sweep_interval_seconds"].value_or<unsigned int>(
            config.session.sweep_interval_seconds);
    }

    // 3. Collaborator directories
    if (auto paths = tbl["paths"]) {
        config.paths.static_dir = paths["static_dir"].value_or(config.paths.static_dir);
        config.paths.template_dir = paths["template_dir"].value_or(config.paths.template_dir);
    }

    // 4. Logging
    if (auto logging = tbl["logging"]) {
        config.logging.level = logging["level"].value_or(config.logging.level);
        config.logging.file = logging["file"].value_or(config.logging.file);
    }

    if (config.server.threads == 0) {
        throw std::runtime_error("server.threads must be > 0");
    }
    if (config.session.sweep_interval_seconds == 0) {
        throw std::runtime_error("session.sweep_interval_seconds must be > 0");
    }
    return config;
}

}  // namespace

AppConfig ParseConfig(std::string_view toml_text) {
    try {
        return FromTable(toml::parse(toml_text));
    } catch (const toml::parse_error& err) {
        spdlog::critical("Failed to parse config: {}", err.description());
        throw std::runtime_error("Config parse error");
    }
}

AppConfig LoadConfig(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        spdlog::warn("Config file '{}' not found. Using defaults.", path);
        return AppConfig{};
    }

    toml::table tbl;
    try {
        tbl = toml::parse_file(path);
    } catch (const toml::parse_error& err) {
        spdlog::critical("Failed to parse config file: {}", err.description());
        throw std::runtime_error("Config parse error");
    }

    AppConfig config = FromTable(tbl);
    spdlog::info("Loaded configuration from {}", path);
    return config;
}

}  // namespace minnow
