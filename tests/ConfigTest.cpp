#include <gtest/gtest.h>

#include <stdexcept>

#include "TempDir.hpp"
#include "config.hpp"

using namespace minnow;

TEST(ConfigTest, EmptyDocumentGivesDefaults) {
    auto config = ParseConfig("");
    EXPECT_EQ(config.server.address, "0.0.0.0");
    EXPECT_EQ(config.server.port, 8080);
    EXPECT_EQ(config.server.threads, 1u);
    EXPECT_EQ(config.session.timeout_seconds, 28800u);
    EXPECT_EQ(config.session.sweep_interval_seconds, 300u);
    EXPECT_EQ(config.paths.static_dir, "static");
    EXPECT_EQ(config.paths.template_dir, "templates");
    EXPECT_EQ(config.logging.level, "info");
}

TEST(ConfigTest, OverridesFromToml) {
    auto config = ParseConfig(R"(
[server]
address = "127.0.0.1"
port = 9090
threads = 4

[session]
timeout_seconds = 60

[paths]
template_dir = "views"

[logging]
level = "debug"
file = ""
)");
    EXPECT_EQ(config.server.address, "127.0.0.1");
    EXPECT_EQ(config.server.port, 9090);
    EXPECT_EQ(config.server.threads, 4u);
    EXPECT_EQ(config.server.idle_timeout_seconds, 15u);
    EXPECT_EQ(config.session.timeout_seconds, 60u);
    EXPECT_EQ(config.session.sweep_interval_seconds, 300u);
    EXPECT_EQ(config.paths.static_dir, "static");
    EXPECT_EQ(config.paths.template_dir, "views");
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_TRUE(config.logging.file.empty());
}

TEST(ConfigTest, RejectsInvalidDocuments) {
    EXPECT_THROW(ParseConfig("[server\nport = "), std::runtime_error);
    EXPECT_THROW(ParseConfig("[server]\nthreads = 0\n"), std::runtime_error);
    EXPECT_THROW(ParseConfig("[session]\nsweep_interval_seconds = 0\n"), std::runtime_error);
}

TEST(ConfigTest, LoadsFileOrFallsBackToDefaults) {
    test::TempDir dir;
    auto file = dir.write("config.toml", "[server]\nport = 7000\n");
    EXPECT_EQ(LoadConfig(file.string()).server.port, 7000);

    auto missing = LoadConfig((dir.path() / "absent.toml").string());
    EXPECT_EQ(missing.server.port, 8080);
}
