#include "workspace_api.hpp"

#include <utility>

namespace bridge {

nlohmann::json ToJson(const WorkspaceStatus& status) {
  nlohmann::json agent;
  agent["type"] = status.agent.type;
  if (status.agent.type != "none" && status.agent.counts) {
    agent["counts"] = {{"idle", status.agent.counts->idle},
                       {"busy", status.agent.counts->busy},
                       {"total", status.agent.counts->total}};
  }
  nlohmann::json out;
  out["isDirty"] = status.is_dirty;
  out["agent"] = std::move(agent);
  return out;
}

nlohmann::json ToJson(const AgentSession& session) {
  return {{"port", session.port}, {"sessionId", session.session_id}};
}

nlohmann::json ToJson(const PromptModel& model) {
  return {{"providerID", model.provider_id}, {"modelID", model.model_id}};
}

nlohmann::json ToJson(const std::map<std::string, std::string>& metadata) {
  nlohmann::json out = nlohmann::json::object();
  for (const auto& [k, v] : metadata) out[k] = v;
  return out;
}

nlohmann::json ToJson(const Workspace& workspace) {
  nlohmann::json out;
  out["projectId"] = workspace.project_id;
  out["name"] = workspace.name;
  out["branch"] = workspace.branch ? nlohmann::json(*workspace.branch) : nlohmann::json(nullptr);
  out["metadata"] = ToJson(workspace.metadata);
  out["path"] = workspace.path;
  return out;
}

}  // namespace bridge
