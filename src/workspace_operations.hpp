#pragma once

#include "agent_model_query.hpp"
#include "logging.hpp"
#include "tool_result.hpp"
#include "workspace_api.hpp"
#include "workspace_registry.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>

namespace bridge {

// Resolve -> dispatch -> envelope for every workspace operation. Both the
// tool front and the socket front call into this.
//
// Arguments are validated first (invalid-input), then the caller's path is
// resolved (workspace-not-found), and only then is the workspace API called.
// Exceptions from the API become internal-error and are logged at error level.
class WorkspaceOperations {
 public:
  WorkspaceOperations(IWorkspaceApi& api,
                      const WorkspaceResolver& resolver,
                      Logger* logger = nullptr,
                      IAgentModelQuery* model_query = nullptr);

  ToolResult GetStatus(const std::string& workspace_path);
  ToolResult GetMetadata(const std::string& workspace_path);
  ToolResult SetMetadata(const std::string& workspace_path, const nlohmann::json& args);
  ToolResult GetAgentSession(const std::string& workspace_path);
  ToolResult RestartAgentServer(const std::string& workspace_path);
  // Resolves the caller's workspace to pick the project of the new one.
  ToolResult Create(const std::string& workspace_path, const nlohmann::json& args);
  ToolResult Delete(const std::string& workspace_path, const nlohmann::json& args);
  ToolResult ExecuteCommand(const std::string& workspace_path, const nlohmann::json& args);

  // Forwards to `sink` (the operations logger when null). Needs no resolution.
  ToolResult Log(const std::string& workspace_path, const nlohmann::json& args, Logger* sink = nullptr);

 private:
  using ResolvedCall = std::function<nlohmann::json(const WorkspaceIdentity& identity)>;

  ToolResult RunResolved(const char* operation, const std::string& workspace_path, const ResolvedCall& call);
  std::optional<PromptModel> CallerModel(const WorkspaceIdentity& caller);

  IWorkspaceApi& api_;
  const WorkspaceResolver& resolver_;
  Logger* logger_;
  IAgentModelQuery* model_query_;
};

}  // namespace bridge
