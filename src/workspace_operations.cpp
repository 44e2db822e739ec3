#include "workspace_operations.hpp"

#include "tool_requests.hpp"

#include <exception>
#include <utility>

namespace bridge {

WorkspaceOperations::WorkspaceOperations(IWorkspaceApi& api,
                                         const WorkspaceResolver& resolver,
                                         Logger* logger,
                                         IAgentModelQuery* model_query)
    : api_(api),
      resolver_(resolver),
      logger_(logger ? logger : DefaultSilentLogger()),
      model_query_(model_query) {}

ToolResult WorkspaceOperations::RunResolved(const char* operation,
                                            const std::string& workspace_path,
                                            const ResolvedCall& call) {
  auto identity = resolver_.Resolve(workspace_path);
  if (!identity) {
    logger_->Debug("Workspace not found", {{"operation", operation}, {"workspace", workspace_path}});
    return ToolFailure(ToolErrorCode::kWorkspaceNotFound, "Workspace not found: " + workspace_path);
  }
  try {
    return ToolSuccess(call(*identity));
  } catch (const std::exception& e) {
    logger_->Error("Operation failed",
                   {{"operation", operation}, {"workspace", workspace_path}, {"error", std::string(e.what())}});
    return ToolFailure(ToolErrorCode::kInternalError, e.what());
  }
}

ToolResult WorkspaceOperations::GetStatus(const std::string& workspace_path) {
  return RunResolved("getStatus", workspace_path, [this](const WorkspaceIdentity& id) {
    return ToJson(api_.GetStatus(id.project_id, id.workspace_name));
  });
}

ToolResult WorkspaceOperations::GetMetadata(const std::string& workspace_path) {
  return RunResolved("getMetadata", workspace_path, [this](const WorkspaceIdentity& id) {
    return ToJson(api_.GetMetadata(id.project_id, id.workspace_name));
  });
}

ToolResult WorkspaceOperations::SetMetadata(const std::string& workspace_path, const nlohmann::json& args) {
  std::string err;
  auto req = ParseSetMetadataRequest(args, &err);
  if (!req) return ToolFailure(ToolErrorCode::kInvalidInput, err);
  return RunResolved("setMetadata", workspace_path, [this, &req](const WorkspaceIdentity& id) {
    api_.SetMetadata(id.project_id, id.workspace_name, req->key, req->value);
    return nlohmann::json(nullptr);
  });
}

ToolResult WorkspaceOperations::GetAgentSession(const std::string& workspace_path) {
  return RunResolved("getAgentSession", workspace_path, [this](const WorkspaceIdentity& id) {
    auto session = api_.GetAgentSession(id.project_id, id.workspace_name);
    return session ? ToJson(*session) : nlohmann::json(nullptr);
  });
}

ToolResult WorkspaceOperations::RestartAgentServer(const std::string& workspace_path) {
  return RunResolved("restartAgentServer", workspace_path, [this](const WorkspaceIdentity& id) {
    return nlohmann::json(api_.RestartAgentServer(id.project_id, id.workspace_name));
  });
}

ToolResult WorkspaceOperations::Create(const std::string& workspace_path, const nlohmann::json& args) {
  std::string err;
  auto req = ParseCreateWorkspaceRequest(args, &err);
  if (!req) return ToolFailure(ToolErrorCode::kInvalidInput, err);
  return RunResolved("create", workspace_path, [this, &req](const WorkspaceIdentity& caller) {
    CreateWorkspaceOptions options;
    options.keep_in_background = req->keep_in_background;
    if (req->initial_prompt) {
      InitialPrompt prompt = *req->initial_prompt;
      if (!prompt.model) prompt.model = CallerModel(caller);
      options.initial_prompt = std::move(prompt);
    }
    return ToJson(api_.Create(caller.project_id, req->name, req->base, options));
  });
}

ToolResult WorkspaceOperations::Delete(const std::string& workspace_path, const nlohmann::json& args) {
  std::string err;
  auto req = ParseDeleteWorkspaceRequest(args, &err);
  if (!req) return ToolFailure(ToolErrorCode::kInvalidInput, err);
  return RunResolved("delete", workspace_path, [this, &req](const WorkspaceIdentity& id) {
    RemoveWorkspaceOptions options;
    options.keep_branch = req->keep_branch;
    auto r = api_.Remove(id.project_id, id.workspace_name, options);
    return nlohmann::json{{"started", r.started}};
  });
}

ToolResult WorkspaceOperations::ExecuteCommand(const std::string& workspace_path, const nlohmann::json& args) {
  std::string err;
  auto req = ParseExecuteCommandRequest(args, &err);
  if (!req) return ToolFailure(ToolErrorCode::kInvalidInput, err);
  return RunResolved("executeCommand", workspace_path, [this, &req](const WorkspaceIdentity& id) {
    auto out = api_.ExecuteCommand(id.project_id, id.workspace_name, req->command, req->args);
    return out ? *out : nlohmann::json(nullptr);
  });
}

ToolResult WorkspaceOperations::Log(const std::string& workspace_path, const nlohmann::json& args, Logger* sink) {
  std::string err;
  auto req = ParseLogRequest(args, &err);
  if (!req) return ToolFailure(ToolErrorCode::kInvalidInput, err);
  LogContext context = req->context;
  context["workspace"] = workspace_path;
  LogAtLevel(sink ? sink : logger_, req->level, req->message, context);
  return ToolVoid();
}

std::optional<PromptModel> WorkspaceOperations::CallerModel(const WorkspaceIdentity& caller) {
  try {
    auto session = api_.GetAgentSession(caller.project_id, caller.workspace_name);
    if (!session) {
      logger_->Debug("Cannot determine model: no agent session running", {{"workspace", caller.workspace_path}});
      return std::nullopt;
    }
    if (!model_query_) return std::nullopt;
    std::string err;
    auto model = model_query_->LatestUserModel(session->port, &err);
    if (!model) {
      if (!err.empty()) {
        logger_->Warn("Failed to get caller model", {{"workspace", caller.workspace_path}, {"error", err}});
      } else {
        logger_->Debug("Cannot determine model: no user messages with model in caller session",
                       {{"workspace", caller.workspace_path}, {"sessionId", session->session_id}});
      }
      return std::nullopt;
    }
    logger_->Debug("Retrieved caller model",
                   {{"workspace", caller.workspace_path}, {"model", model->provider_id + "/" + model->model_id}});
    return model;
  } catch (const std::exception& e) {
    logger_->Warn("Failed to get caller model", {{"workspace", caller.workspace_path}, {"error", std::string(e.what())}});
    return std::nullopt;
  }
}

}  // namespace bridge
