#include "standalone_workspace_api.hpp"

#include "workspace_path.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

namespace bridge {
namespace {

static std::string ParentDir(const std::string& path) {
  const auto pos = path.rfind('/');
  if (pos == std::string::npos) return {};
  if (pos == 0) return "/";
  return path.substr(0, pos);
}

static std::string JoinPath(const std::string& dir, const std::string& name) {
  if (dir.empty()) return name;
  if (dir.back() == '/') return dir + name;
  return dir + "/" + name;
}

}  // namespace

StandaloneWorkspaceApi::StandaloneWorkspaceApi(Logger* logger) : logger_(logger ? logger : DefaultSilentLogger()) {}

void StandaloneWorkspaceApi::SetCommandForwarder(CommandForwarder forwarder) {
  std::lock_guard<std::mutex> lock(mu_);
  command_forwarder_ = std::move(forwarder);
}

void StandaloneWorkspaceApi::Seed(const WorkspaceIdentity& identity) {
  Workspace ws;
  ws.project_id = identity.project_id;
  ws.name = identity.workspace_name;
  ws.branch = identity.workspace_name;
  ws.path = NormalizeWorkspacePath(identity.workspace_path);
  std::lock_guard<std::mutex> lock(mu_);
  workspaces_[{ws.project_id, ws.name}] = std::move(ws);
}

std::vector<Workspace> StandaloneWorkspaceApi::List() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<Workspace> out;
  out.reserve(workspaces_.size());
  for (const auto& [_, ws] : workspaces_) out.push_back(ws);
  return out;
}

Workspace StandaloneWorkspaceApi::Create(const std::string& project_id,
                                         const std::string& name,
                                         const std::string& base,
                                         const CreateWorkspaceOptions& options) {
  Workspace created;
  {
    std::lock_guard<std::mutex> lock(mu_);
    CheckNotDisposedLocked();
    if (workspaces_.count({project_id, name})) {
      throw std::runtime_error("Workspace already exists: " + name);
    }
    std::string root;
    for (const auto& [key, ws] : workspaces_) {
      if (key.first == project_id) {
        root = ParentDir(ws.path);
        break;
      }
    }
    if (root.empty()) throw std::runtime_error("Project not found: " + project_id);

    created.project_id = project_id;
    created.name = name;
    created.branch = name;
    created.metadata["base"] = base;
    created.path = JoinPath(root, name);
    workspaces_[{project_id, name}] = created;
  }

  nlohmann::json payload;
  payload["projectId"] = project_id;
  payload["workspace"] = ToJson(created);
  payload["hasInitialPrompt"] = options.initial_prompt.has_value();
  payload["keepInBackground"] = options.keep_in_background;
  logger_->Info("Workspace created", {{"projectId", project_id}, {"workspace", name}, {"path", created.path}});
  Emit("workspace:created", payload);
  return created;
}

RemoveWorkspaceResult StandaloneWorkspaceApi::Remove(const std::string& project_id,
                                                     const std::string& workspace_name,
                                                     const RemoveWorkspaceOptions& options) {
  std::string path;
  {
    std::lock_guard<std::mutex> lock(mu_);
    CheckNotDisposedLocked();
    path = FindLocked(project_id, workspace_name).path;
    workspaces_.erase({project_id, workspace_name});
  }
  logger_->Info("Workspace removed",
                {{"projectId", project_id}, {"workspace", workspace_name}, {"keepBranch", options.keep_branch}});
  Emit("workspace:removed", {{"projectId", project_id}, {"workspaceName", workspace_name}, {"path", path}});
  return RemoveWorkspaceResult{true};
}

WorkspaceStatus StandaloneWorkspaceApi::GetStatus(const std::string& project_id, const std::string& workspace_name) {
  std::lock_guard<std::mutex> lock(mu_);
  CheckNotDisposedLocked();
  FindLocked(project_id, workspace_name);
  return WorkspaceStatus{};
}

std::map<std::string, std::string> StandaloneWorkspaceApi::GetMetadata(const std::string& project_id,
                                                                       const std::string& workspace_name) {
  std::lock_guard<std::mutex> lock(mu_);
  CheckNotDisposedLocked();
  return FindLocked(project_id, workspace_name).metadata;
}

void StandaloneWorkspaceApi::SetMetadata(const std::string& project_id,
                                         const std::string& workspace_name,
                                         const std::string& key,
                                         const std::optional<std::string>& value) {
  std::lock_guard<std::mutex> lock(mu_);
  CheckNotDisposedLocked();
  auto& ws = FindLocked(project_id, workspace_name);
  if (value) {
    ws.metadata[key] = *value;
  } else {
    ws.metadata.erase(key);
  }
}

std::optional<nlohmann::json> StandaloneWorkspaceApi::ExecuteCommand(const std::string& project_id,
                                                                     const std::string& workspace_name,
                                                                     const std::string& command,
                                                                     const nlohmann::json& args) {
  std::string path;
  CommandForwarder forwarder;
  {
    std::lock_guard<std::mutex> lock(mu_);
    CheckNotDisposedLocked();
    path = FindLocked(project_id, workspace_name).path;
    forwarder = command_forwarder_;
  }
  if (!forwarder) throw std::runtime_error("No editor connection available");

  auto r = forwarder(path, command, args);
  if (!r.ok) throw std::runtime_error(r.error_message);
  if (r.data.is_null()) return std::nullopt;
  return r.data;
}

std::optional<AgentSession> StandaloneWorkspaceApi::GetAgentSession(const std::string& project_id,
                                                                    const std::string& workspace_name) {
  std::lock_guard<std::mutex> lock(mu_);
  CheckNotDisposedLocked();
  FindLocked(project_id, workspace_name);
  return std::nullopt;
}

int StandaloneWorkspaceApi::RestartAgentServer(const std::string& project_id, const std::string& workspace_name) {
  std::lock_guard<std::mutex> lock(mu_);
  CheckNotDisposedLocked();
  FindLocked(project_id, workspace_name);
  throw std::runtime_error("No agent server is running for workspace: " + workspace_name);
}

Unsubscribe StandaloneWorkspaceApi::On(const std::string& event, WorkspaceEventHandler handler) {
  std::lock_guard<std::mutex> lock(mu_);
  const uint64_t id = next_handler_id_++;
  handlers_[event].emplace_back(id, std::move(handler));
  return [this, event, id]() {
    std::lock_guard<std::mutex> inner(mu_);
    auto it = handlers_.find(event);
    if (it == handlers_.end()) return;
    auto& list = it->second;
    for (auto h = list.begin(); h != list.end(); ++h) {
      if (h->first == id) {
        list.erase(h);
        return;
      }
    }
  };
}

void StandaloneWorkspaceApi::Dispose() {
  std::lock_guard<std::mutex> lock(mu_);
  disposed_ = true;
  handlers_.clear();
  command_forwarder_ = nullptr;
}

Workspace& StandaloneWorkspaceApi::FindLocked(const std::string& project_id, const std::string& workspace_name) {
  auto it = workspaces_.find({project_id, workspace_name});
  if (it == workspaces_.end()) {
    throw std::runtime_error("Workspace not found: " + project_id + "/" + workspace_name);
  }
  return it->second;
}

void StandaloneWorkspaceApi::CheckNotDisposedLocked() const {
  if (disposed_) throw std::runtime_error("Workspace API has been disposed");
}

void StandaloneWorkspaceApi::Emit(const std::string& event, const nlohmann::json& payload) {
  std::vector<WorkspaceEventHandler> handlers;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = handlers_.find(event);
    if (it == handlers_.end()) return;
    for (const auto& [_, h] : it->second) handlers.push_back(h);
  }
  for (const auto& h : handlers) {
    try {
      h(payload);
    } catch (const std::exception& e) {
      logger_->Error("Event handler error", {{"event", event}, {"error", std::string(e.what())}});
    }
  }
}

}  // namespace bridge
