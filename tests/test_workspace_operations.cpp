#include <gtest/gtest.h>
#include "test_support.hpp"
#include "workspace_operations.hpp"
#include "workspace_registry.hpp"

using namespace bridge;
using bridge::test::CapturingLogger;
using bridge::test::FakeAgentModelQuery;
using bridge::test::FakeWorkspaceApi;
using nlohmann::json;

class WorkspaceOperationsTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry.Register({"proj", "feature", "/work/proj/feature"});
    }

    FakeWorkspaceApi api;
    WorkspaceIdentityRegistry registry;
    CapturingLogger logger;
    FakeAgentModelQuery model_query;
    WorkspaceOperations ops{api, registry, &logger, &model_query};
};

TEST_F(WorkspaceOperationsTest, UnknownWorkspaceNeverReachesApi) {
    auto r = ops.GetStatus("/work/elsewhere");
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error_code, ToolErrorCode::kWorkspaceNotFound);
    EXPECT_EQ(r.error_message, "Workspace not found: /work/elsewhere");

    ops.GetMetadata("/work/elsewhere");
    ops.SetMetadata("/work/elsewhere", json{{"key", "k"}, {"value", "v"}});
    ops.Delete("/work/elsewhere", nullptr);
    ops.ExecuteCommand("/work/elsewhere", json{{"command", "x"}});
    ops.Create("/work/elsewhere", json{{"name", "n"}, {"base", "main"}});
    EXPECT_EQ(api.CallCount(), 0);
}

TEST_F(WorkspaceOperationsTest, ResolvesEquivalentPathSpellings) {
    api.status.is_dirty = true;
    auto r = ops.GetStatus("/work/proj/feature/");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.data["isDirty"], true);
    auto call = api.LastCall("getStatus");
    ASSERT_TRUE(call.has_value());
    EXPECT_EQ(call->project_id, "proj");
    EXPECT_EQ(call->workspace_name, "feature");
}

TEST_F(WorkspaceOperationsTest, InvalidInputIsReportedBeforeResolution) {
    auto r = ops.SetMetadata("/work/elsewhere", json{{"key", "bad key"}, {"value", "v"}});
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error_code, ToolErrorCode::kInvalidInput);
    EXPECT_EQ(api.CallCount(), 0);
}

TEST_F(WorkspaceOperationsTest, ApiFailureBecomesInternalErrorAndIsLogged) {
    api.fail_with = std::string("disk full");
    auto r = ops.GetMetadata("/work/proj/feature");
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error_code, ToolErrorCode::kInternalError);
    EXPECT_EQ(r.error_message, "disk full");
    EXPECT_TRUE(logger.Contains(LogLevel::kError, "Operation failed"));
}

TEST_F(WorkspaceOperationsTest, SetMetadataNullClearsKey) {
    auto r = ops.SetMetadata("/work/proj/feature", json{{"key", "note"}, {"value", nullptr}});
    ASSERT_TRUE(r.ok);
    EXPECT_TRUE(r.data.is_null());
    auto call = api.LastCall("setMetadata");
    ASSERT_TRUE(call.has_value());
    EXPECT_TRUE(call->detail["value"].is_null());
}

TEST_F(WorkspaceOperationsTest, DeleteAcceptsNullPayload) {
    auto r = ops.Delete("/work/proj/feature", nullptr);
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.data["started"], true);
    auto call = api.LastCall("remove");
    ASSERT_TRUE(call.has_value());
    EXPECT_EQ(call->detail["keepBranch"], false);
}

TEST_F(WorkspaceOperationsTest, ExecuteCommandReturnsNullWithoutValue) {
    auto r = ops.ExecuteCommand("/work/proj/feature", json{{"command", "save"}});
    ASSERT_TRUE(r.ok);
    EXPECT_TRUE(r.data.is_null());

    api.command_result = json{{"opened", 2}};
    auto with_value = ops.ExecuteCommand("/work/proj/feature", json{{"command", "open"}, {"args", {"a"}}});
    ASSERT_TRUE(with_value.ok);
    EXPECT_EQ(with_value.data["opened"], 2);
}

TEST_F(WorkspaceOperationsTest, AgentSessionAbsentIsNull) {
    auto none = ops.GetAgentSession("/work/proj/feature");
    ASSERT_TRUE(none.ok);
    EXPECT_TRUE(none.data.is_null());

    api.agent_session = AgentSession{4100, "ses_1"};
    auto some = ops.GetAgentSession("/work/proj/feature");
    ASSERT_TRUE(some.ok);
    EXPECT_EQ(some.data["port"], 4100);
    EXPECT_EQ(some.data["sessionId"], "ses_1");
}

TEST_F(WorkspaceOperationsTest, RestartReturnsPort) {
    api.restart_port = 4555;
    auto r = ops.RestartAgentServer("/work/proj/feature");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.data, 4555);
}

TEST_F(WorkspaceOperationsTest, CreateUsesCallerProjectAndInheritsModel) {
    api.agent_session = AgentSession{4100, "ses_1"};
    model_query.model = PromptModel{"anthropic", "sonnet"};

    auto r = ops.Create("/work/proj/feature", json{{"name", "next"}, {"base", "main"}, {"initialPrompt", "start"}});
    ASSERT_TRUE(r.ok) << r.error_message;
    EXPECT_EQ(r.data["projectId"], "proj");
    EXPECT_EQ(r.data["name"], "next");
    EXPECT_EQ(model_query.last_port, 4100);

    auto call = api.LastCall("create");
    ASSERT_TRUE(call.has_value());
    EXPECT_EQ(call->project_id, "proj");
    EXPECT_EQ(call->detail["keepInBackground"], true);
    EXPECT_EQ(call->detail["initialPrompt"]["model"]["providerID"], "anthropic");
    EXPECT_EQ(call->detail["initialPrompt"]["model"]["modelID"], "sonnet");
}

TEST_F(WorkspaceOperationsTest, CreateKeepsExplicitModel) {
    api.agent_session = AgentSession{4100, "ses_1"};
    model_query.model = PromptModel{"anthropic", "sonnet"};
    json prompt = {{"prompt", "go"}, {"model", {{"providerID", "openai"}, {"modelID", "gpt"}}}};
    auto r = ops.Create("/work/proj/feature", json{{"name", "n"}, {"base", "main"}, {"initialPrompt", prompt}});
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(model_query.calls, 0);
    EXPECT_EQ(api.LastCall("create")->detail["initialPrompt"]["model"]["providerID"], "openai");
}

TEST_F(WorkspaceOperationsTest, CreateWithoutAgentSessionProceedsWithoutModel) {
    auto r = ops.Create("/work/proj/feature", json{{"name", "n"}, {"base", "main"}, {"initialPrompt", "go"}});
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(model_query.calls, 0);
    EXPECT_FALSE(api.LastCall("create")->detail["initialPrompt"].contains("model"));
    EXPECT_TRUE(logger.Contains(LogLevel::kDebug, "Cannot determine model: no agent session running"));
}

TEST_F(WorkspaceOperationsTest, CreateModelLookupFailureOnlyWarns) {
    api.agent_session_error = std::string("agent offline");
    auto r = ops.Create("/work/proj/feature", json{{"name", "n"}, {"base", "main"}, {"initialPrompt", "go"}});
    ASSERT_TRUE(r.ok);
    EXPECT_TRUE(logger.Contains(LogLevel::kWarn, "Failed to get caller model"));

    api.agent_session_error.reset();
    api.agent_session = AgentSession{4100, "ses_1"};
    model_query.error = std::string("connection refused");
    auto again = ops.Create("/work/proj/feature", json{{"name", "m"}, {"base", "main"}, {"initialPrompt", "go"}});
    ASSERT_TRUE(again.ok);
    EXPECT_EQ(logger.AtLevel(LogLevel::kWarn).size(), 2u);
}

TEST_F(WorkspaceOperationsTest, CreateWithoutPromptSkipsModelLookup) {
    auto r = ops.Create("/work/proj/feature", json{{"name", "n"}, {"base", "main"}});
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(api.CallCount("getAgentSession"), 0);
}

TEST_F(WorkspaceOperationsTest, LogForwardsWithWorkspaceContext) {
    CapturingLogger sink;
    auto r = ops.Log("/work/anywhere", json{{"level", "warn"}, {"message", "slow"}, {"context", {{"ms", 9}}}}, &sink);
    ASSERT_TRUE(r.ok);
    EXPECT_TRUE(r.data.is_null());
    auto entries = sink.AtLevel(LogLevel::kWarn);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "slow");
    EXPECT_EQ(entries[0].context["workspace"], "/work/anywhere");
    EXPECT_EQ(entries[0].context["ms"], 9);
    EXPECT_EQ(api.CallCount(), 0);
}

TEST_F(WorkspaceOperationsTest, LogRejectsMalformedEntry) {
    auto r = ops.Log("/work/proj/feature", json{{"level", "info"}});
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error_code, ToolErrorCode::kInvalidInput);
}
