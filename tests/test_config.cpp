#include <gtest/gtest.h>
#include "config.hpp"
#include "logging.hpp"

#include <cstdlib>

using namespace bridge;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { ClearEnv(); }
    void TearDown() override { ClearEnv(); }

    static void ClearEnv() {
        for (const char* name : {"BRIDGE_MCP_PORT", "BRIDGE_PLUGIN_PORT", "BRIDGE_PLUGIN_ENABLED", "BRIDGE_LOG_LEVEL",
                                 "BRIDGE_DEVELOPMENT", "BRIDGE_COMMAND_TIMEOUT_MS", "BRIDGE_AGENT_QUERY_TIMEOUT_S",
                                 "BRIDGE_SOCKET_WORKERS", "BRIDGE_WORKSPACES"}) {
            ::unsetenv(name);
        }
    }
};

TEST_F(ConfigTest, DefaultsWithoutEnvironment) {
    auto cfg = LoadConfigFromEnv();
    EXPECT_EQ(cfg.mcp_port, 0);
    EXPECT_EQ(cfg.plugin_port, 0);
    EXPECT_TRUE(cfg.plugin_enabled);
    EXPECT_EQ(cfg.log_level, LogLevel::kInfo);
    EXPECT_FALSE(cfg.development);
    EXPECT_EQ(cfg.command_timeout_ms, 10000);
    EXPECT_EQ(cfg.socket_workers, 4);
    EXPECT_EQ(cfg.agent_query_timeout_seconds, 5);
    EXPECT_TRUE(cfg.workspaces.empty());
}

TEST_F(ConfigTest, ReadsEnvironment) {
    ::setenv("BRIDGE_MCP_PORT", "4711", 1);
    ::setenv("BRIDGE_PLUGIN_PORT", "4712", 1);
    ::setenv("BRIDGE_PLUGIN_ENABLED", "off", 1);
    ::setenv("BRIDGE_LOG_LEVEL", "Debug", 1);
    ::setenv("BRIDGE_DEVELOPMENT", "yes", 1);
    ::setenv("BRIDGE_COMMAND_TIMEOUT_MS", "2500", 1);
    ::setenv("BRIDGE_AGENT_QUERY_TIMEOUT_S", "9", 1);
    ::setenv("BRIDGE_SOCKET_WORKERS", "8", 1);
    ::setenv("BRIDGE_WORKSPACES", "proj/main=/work/proj/main/, proj/feat=/work/proj/feat", 1);

    auto cfg = LoadConfigFromEnv();
    EXPECT_EQ(cfg.mcp_port, 4711);
    EXPECT_EQ(cfg.plugin_port, 4712);
    EXPECT_FALSE(cfg.plugin_enabled);
    EXPECT_EQ(cfg.log_level, LogLevel::kDebug);
    EXPECT_TRUE(cfg.development);
    EXPECT_EQ(cfg.command_timeout_ms, 2500);
    EXPECT_EQ(cfg.agent_query_timeout_seconds, 9);
    EXPECT_EQ(cfg.socket_workers, 8);
    ASSERT_EQ(cfg.workspaces.size(), 2u);
    EXPECT_EQ(cfg.workspaces[0].workspace_path, "/work/proj/main");
}

TEST_F(ConfigTest, InvalidValuesKeepDefaults) {
    ::setenv("BRIDGE_MCP_PORT", "70000", 1);
    ::setenv("BRIDGE_PLUGIN_PORT", "abc", 1);
    ::setenv("BRIDGE_PLUGIN_ENABLED", "maybe", 1);
    ::setenv("BRIDGE_LOG_LEVEL", "verbose", 1);
    ::setenv("BRIDGE_COMMAND_TIMEOUT_MS", "0", 1);
    ::setenv("BRIDGE_SOCKET_WORKERS", "65", 1);

    auto cfg = LoadConfigFromEnv();
    EXPECT_EQ(cfg.mcp_port, 0);
    EXPECT_EQ(cfg.plugin_port, 0);
    EXPECT_TRUE(cfg.plugin_enabled);
    EXPECT_EQ(cfg.log_level, LogLevel::kInfo);
    EXPECT_EQ(cfg.command_timeout_ms, 10000);
    EXPECT_EQ(cfg.socket_workers, 4);
}

TEST(WorkspaceSeedsTest, SkipsMalformedEntries) {
    auto seeds = ParseWorkspaceSeeds("p/a=/w/a,noequals,/b=/w/b,p/=/w/c,p/d=relative,p/e=C:\\w\\e");
    ASSERT_EQ(seeds.size(), 2u);
    EXPECT_EQ(seeds[0].project_id, "p");
    EXPECT_EQ(seeds[0].workspace_name, "a");
    EXPECT_EQ(seeds[0].workspace_path, "/w/a");
    EXPECT_EQ(seeds[1].workspace_name, "e");
    EXPECT_EQ(seeds[1].workspace_path, "C:/w/e");
}

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(ParseLogLevel("silly"), LogLevel::kSilly);
    EXPECT_EQ(ParseLogLevel("WARN"), LogLevel::kWarn);
    EXPECT_EQ(ParseLogLevel("Error"), LogLevel::kError);
    EXPECT_FALSE(ParseLogLevel("trace").has_value());
    EXPECT_STREQ(LogLevelName(LogLevel::kDebug), "debug");
}
