#pragma once

#include "logging.hpp"
#include "tool_result.hpp"
#include "workspace_api.hpp"
#include "workspace_registry.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace bridge {

// In-memory workspace API for running the bridge without the desktop shell.
// Workspaces live under their project's directory; editor commands are
// forwarded through `command_forwarder` (normally the socket front).
class StandaloneWorkspaceApi : public IWorkspaceApi {
 public:
  using CommandForwarder =
      std::function<ToolResult(const std::string& workspace_path, const std::string& command, const nlohmann::json& args)>;

  explicit StandaloneWorkspaceApi(Logger* logger = nullptr);

  void SetCommandForwarder(CommandForwarder forwarder);
  // Adds an existing workspace without emitting events.
  void Seed(const WorkspaceIdentity& identity);
  std::vector<Workspace> List() const;

  Workspace Create(const std::string& project_id,
                   const std::string& name,
                   const std::string& base,
                   const CreateWorkspaceOptions& options) override;
  RemoveWorkspaceResult Remove(const std::string& project_id,
                               const std::string& workspace_name,
                               const RemoveWorkspaceOptions& options) override;
  WorkspaceStatus GetStatus(const std::string& project_id, const std::string& workspace_name) override;
  std::map<std::string, std::string> GetMetadata(const std::string& project_id,
                                                 const std::string& workspace_name) override;
  void SetMetadata(const std::string& project_id,
                   const std::string& workspace_name,
                   const std::string& key,
                   const std::optional<std::string>& value) override;
  std::optional<nlohmann::json> ExecuteCommand(const std::string& project_id,
                                               const std::string& workspace_name,
                                               const std::string& command,
                                               const nlohmann::json& args) override;
  std::optional<AgentSession> GetAgentSession(const std::string& project_id,
                                              const std::string& workspace_name) override;
  int RestartAgentServer(const std::string& project_id, const std::string& workspace_name) override;

  Unsubscribe On(const std::string& event, WorkspaceEventHandler handler) override;
  void Dispose() override;

 private:
  using Key = std::pair<std::string, std::string>;

  Workspace& FindLocked(const std::string& project_id, const std::string& workspace_name);
  void CheckNotDisposedLocked() const;
  void Emit(const std::string& event, const nlohmann::json& payload);

  Logger* logger_;
  mutable std::mutex mu_;
  std::map<Key, Workspace> workspaces_;
  CommandForwarder command_forwarder_;
  std::map<std::string, std::vector<std::pair<uint64_t, WorkspaceEventHandler>>> handlers_;
  uint64_t next_handler_id_ = 1;
  bool disposed_ = false;
};

}  // namespace bridge
