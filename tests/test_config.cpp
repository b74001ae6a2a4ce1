// File: tests/test_config.cpp
// Purpose: Runtime configuration parsing and file fallbacks.

#include <gtest/gtest.h>

#include "core/config.hpp"
#include "core/log.hpp"
#include "test_support.hpp"

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

using conduit::RuntimeConfig;

namespace
{
std::string writeTemp(const std::string &name, const std::string &contents)
{
    std::string path = ::testing::TempDir() + name;
    std::ofstream ofs(path);
    ofs << contents;
    return path;
}
} // namespace

TEST(ConfigTest, DefaultsWhenKeysAbsent)
{
    RuntimeConfig config = conduit::parse_runtime_config(json::object());
    EXPECT_EQ(config.queue_label, "ipc");
    EXPECT_EQ(config.log_capacity, 200u);
    EXPECT_EQ(config.listen_host, "0.0.0.0");
    EXPECT_EQ(config.listen_port, 8080);
    EXPECT_EQ(config.invoke_timeout.count(), 0);
    EXPECT_TRUE(config.plugins.empty());
}

TEST(ConfigTest, ParsesEveryKey)
{
    json doc = {
        {"queue_label", "commands"},
        {"log_capacity", 16},
        {"listen_host", "127.0.0.1"},
        {"listen_port", 9000},
        {"invoke_timeout_ms", 2500},
        {"plugins", {{"echo", {{"prefix", ">"}}}}},
    };
    RuntimeConfig config = conduit::parse_runtime_config(doc);
    EXPECT_EQ(config.queue_label, "commands");
    EXPECT_EQ(config.log_capacity, 16u);
    EXPECT_EQ(config.listen_host, "127.0.0.1");
    EXPECT_EQ(config.listen_port, 9000);
    EXPECT_EQ(config.invoke_timeout.count(), 2500);
    EXPECT_EQ(conduit::plugin_config_for(config, "echo"), R"({"prefix":">"})");
    EXPECT_EQ(conduit::plugin_config_for(config, "other"), "{}");
}

TEST(ConfigTest, RejectsWrongShapes)
{
    EXPECT_THROW(conduit::parse_runtime_config(json::array()), std::runtime_error);
    EXPECT_THROW(conduit::parse_runtime_config(json{{"plugins", 3}}), std::runtime_error);
    EXPECT_THROW(conduit::parse_runtime_config(json{{"listen_port", "eighty"}}), json::type_error);
}

TEST(ConfigTest, MissingFileFallsBackToDefaults)
{
    conduit::clear_logs();
    RuntimeConfig config = conduit::load_runtime_config(::testing::TempDir() + "conduit_no_such_file.json");
    EXPECT_EQ(config.listen_port, 8080);
    EXPECT_TRUE(conduit_test::containsLine(conduit::recent_logs(), "[WARN]"));
}

TEST(ConfigTest, CorruptFileFallsBackToDefaults)
{
    conduit::clear_logs();
    std::string path = writeTemp("conduit_corrupt.json", "{ \"listen_port\": ");
    RuntimeConfig config = conduit::load_runtime_config(path);
    EXPECT_EQ(config.listen_port, 8080);
    EXPECT_TRUE(conduit_test::containsLine(conduit::recent_logs(), "Config Parse Error"));
    std::remove(path.c_str());
}

TEST(ConfigTest, LoadsFile)
{
    std::string path = writeTemp("conduit_ok.json", R"({"queue_label":"q","listen_port":1234})");
    RuntimeConfig config = conduit::load_runtime_config(path);
    EXPECT_EQ(config.queue_label, "q");
    EXPECT_EQ(config.listen_port, 1234);
    std::remove(path.c_str());
}

TEST(LogTest, RingKeepsNewestLines)
{
    conduit::clear_logs();
    conduit::set_log_capacity(3);
    for (int i = 0; i < 5; ++i)
        conduit::conduit_log("INFO", "line " + std::to_string(i));

    auto lines = conduit::recent_logs();
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_NE(lines[0].find("line 2"), std::string::npos);
    EXPECT_NE(lines[2].find("[INFO] line 4"), std::string::npos);

    conduit::set_log_capacity(200);
}
