#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace bridge {

struct AgentStatusCounts {
  int idle = 0;
  int busy = 0;
  int total = 0;
};

// type is one of "none", "idle", "busy", "mixed"; counts are absent for "none".
struct AgentStatus {
  std::string type = "none";
  std::optional<AgentStatusCounts> counts;
};

struct WorkspaceStatus {
  bool is_dirty = false;
  AgentStatus agent;
};

struct AgentSession {
  int port = 0;
  std::string session_id;
};

struct PromptModel {
  std::string provider_id;
  std::string model_id;
};

struct InitialPrompt {
  std::string prompt;
  std::optional<std::string> agent;
  std::optional<PromptModel> model;
};

struct CreateWorkspaceOptions {
  std::optional<InitialPrompt> initial_prompt;
  bool keep_in_background = true;
};

struct Workspace {
  std::string project_id;
  std::string name;
  std::optional<std::string> branch;
  std::map<std::string, std::string> metadata;
  std::string path;
};

struct RemoveWorkspaceOptions {
  bool keep_branch = false;
};

struct RemoveWorkspaceResult {
  bool started = true;
};

// Events emitted by the API: "workspace:created" carries
// {projectId, workspace, hasInitialPrompt, keepInBackground};
// "workspace:removed" carries {projectId, workspaceName, path}.
using WorkspaceEventHandler = std::function<void(const nlohmann::json& payload)>;
using Unsubscribe = std::function<void()>;

// Internal workspace capability consumed by the bridge. Implementations
// report failures by throwing std::exception-derived exceptions.
class IWorkspaceApi {
 public:
  virtual ~IWorkspaceApi() = default;

  virtual Workspace Create(const std::string& project_id,
                           const std::string& name,
                           const std::string& base,
                           const CreateWorkspaceOptions& options) = 0;
  virtual RemoveWorkspaceResult Remove(const std::string& project_id,
                                       const std::string& workspace_name,
                                       const RemoveWorkspaceOptions& options) = 0;
  virtual WorkspaceStatus GetStatus(const std::string& project_id, const std::string& workspace_name) = 0;
  virtual std::map<std::string, std::string> GetMetadata(const std::string& project_id,
                                                         const std::string& workspace_name) = 0;
  // A null value deletes the key.
  virtual void SetMetadata(const std::string& project_id,
                           const std::string& workspace_name,
                           const std::string& key,
                           const std::optional<std::string>& value) = 0;
  // nullopt when the command produced no value.
  virtual std::optional<nlohmann::json> ExecuteCommand(const std::string& project_id,
                                                       const std::string& workspace_name,
                                                       const std::string& command,
                                                       const nlohmann::json& args) = 0;
  virtual std::optional<AgentSession> GetAgentSession(const std::string& project_id,
                                                      const std::string& workspace_name) = 0;
  // Returns the port of the restarted agent server.
  virtual int RestartAgentServer(const std::string& project_id, const std::string& workspace_name) = 0;

  virtual Unsubscribe On(const std::string& event, WorkspaceEventHandler handler) = 0;
  virtual void Dispose() = 0;
};

nlohmann::json ToJson(const WorkspaceStatus& status);
nlohmann::json ToJson(const AgentSession& session);
nlohmann::json ToJson(const PromptModel& model);
nlohmann::json ToJson(const Workspace& workspace);
nlohmann::json ToJson(const std::map<std::string, std::string>& metadata);

}  // namespace bridge
