#include <gtest/gtest.h>
#include "standalone_workspace_api.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace bridge;
using nlohmann::json;

class StandaloneWorkspaceApiTest : public ::testing::Test {
protected:
    void SetUp() override { api.Seed({"proj", "main", "/work/proj/main/"}); }

    StandaloneWorkspaceApi api;
};

TEST_F(StandaloneWorkspaceApiTest, CreatePlacesWorkspaceBesideSiblings) {
    std::vector<json> events;
    auto unsubscribe = api.On("workspace:created", [&events](const json& payload) { events.push_back(payload); });

    CreateWorkspaceOptions options;
    options.initial_prompt = InitialPrompt{"start", std::nullopt, std::nullopt};
    auto ws = api.Create("proj", "feature", "main", options);
    EXPECT_EQ(ws.path, "/work/proj/feature");
    ASSERT_TRUE(ws.branch.has_value());
    EXPECT_EQ(*ws.branch, "feature");
    EXPECT_EQ(ws.metadata.at("base"), "main");

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0]["workspace"]["path"], "/work/proj/feature");
    EXPECT_EQ(events[0]["hasInitialPrompt"], true);
    EXPECT_EQ(events[0]["keepInBackground"], true);

    unsubscribe();
    api.Create("proj", "other", "main", CreateWorkspaceOptions());
    EXPECT_EQ(events.size(), 1u);
}

TEST_F(StandaloneWorkspaceApiTest, CreateRejectsDuplicatesAndUnknownProjects) {
    EXPECT_THROW(api.Create("proj", "main", "main", CreateWorkspaceOptions()), std::runtime_error);
    EXPECT_THROW(api.Create("nope", "x", "main", CreateWorkspaceOptions()), std::runtime_error);
}

TEST_F(StandaloneWorkspaceApiTest, MetadataSetAndClear) {
    api.SetMetadata("proj", "main", "note", std::string("hello"));
    EXPECT_EQ(api.GetMetadata("proj", "main").at("note"), "hello");
    api.SetMetadata("proj", "main", "note", std::nullopt);
    EXPECT_EQ(api.GetMetadata("proj", "main").count("note"), 0u);
    EXPECT_THROW(api.GetMetadata("proj", "missing"), std::runtime_error);
}

TEST_F(StandaloneWorkspaceApiTest, RemoveEmitsPath) {
    std::string removed;
    api.On("workspace:removed", [&removed](const json& payload) { removed = payload["path"].get<std::string>(); });
    auto r = api.Remove("proj", "main", RemoveWorkspaceOptions());
    EXPECT_TRUE(r.started);
    EXPECT_EQ(removed, "/work/proj/main");
    EXPECT_TRUE(api.List().empty());
}

TEST_F(StandaloneWorkspaceApiTest, ThrowingHandlerDoesNotFailCreate) {
    api.On("workspace:created", [](const json&) { throw std::runtime_error("listener broke"); });
    EXPECT_NO_THROW(api.Create("proj", "feature", "main", CreateWorkspaceOptions()));
}

TEST_F(StandaloneWorkspaceApiTest, ExecuteCommandUsesForwarder) {
    EXPECT_THROW(api.ExecuteCommand("proj", "main", "save", json::array()), std::runtime_error);

    std::string forwarded_path;
    api.SetCommandForwarder([&forwarded_path](const std::string& path, const std::string& command, const json&) {
        forwarded_path = path;
        if (command == "fail") return ToolFailure(ToolErrorCode::kInternalError, "editor refused");
        if (command == "count") return ToolSuccess(3);
        return ToolVoid();
    });
    EXPECT_FALSE(api.ExecuteCommand("proj", "main", "save", json::array()).has_value());
    EXPECT_EQ(forwarded_path, "/work/proj/main");
    auto counted = api.ExecuteCommand("proj", "main", "count", json::array());
    ASSERT_TRUE(counted.has_value());
    EXPECT_EQ(*counted, 3);
    EXPECT_THROW(api.ExecuteCommand("proj", "main", "fail", json::array()), std::runtime_error);
}

TEST_F(StandaloneWorkspaceApiTest, NoAgentServers) {
    EXPECT_FALSE(api.GetAgentSession("proj", "main").has_value());
    EXPECT_THROW(api.RestartAgentServer("proj", "main"), std::runtime_error);
}

TEST_F(StandaloneWorkspaceApiTest, DisposedApiRefusesCalls) {
    api.Dispose();
    EXPECT_THROW(api.GetStatus("proj", "main"), std::runtime_error);
}
