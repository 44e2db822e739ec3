#include "tool_protocol_server.hpp"

#include <exception>
#include <utility>

namespace bridge {

const char* const kServerInstructions =
    "Workspaces are git worktrees managed by the bridge, each with its own AI agent session.\n"
    "\n"
    "workspace_create starts a new workspace in the caller's project. Its initialPrompt decides what the new "
    "agent works on. Pass the object form { prompt, agent } to choose the agent's permission mode:\n"
    "- agent: \"plan\" starts the agent read-only, for planning, research or exploration before any change.\n"
    "- without agent the agent starts with full permissions and goes straight to implementation.\n"
    "\n"
    "The model of your current session is passed on to the new workspace automatically.";

namespace {

static void SendJson(httplib::Response* res, int status, const nlohmann::json& body) {
  res->status = status;
  res->set_content(body.dump(), "application/json");
}

static nlohmann::json ObjectSchema(nlohmann::json properties, nlohmann::json required = nlohmann::json::array()) {
  nlohmann::json schema;
  schema["type"] = "object";
  schema["properties"] = std::move(properties);
  if (!required.empty()) schema["required"] = std::move(required);
  return schema;
}

}  // namespace

ToolProtocolFront::ToolProtocolFront(IWorkspaceApi& api,
                                     Logger* logger,
                                     RequestCallback on_request,
                                     IAgentModelQuery* model_query)
    : api_(api),
      logger_(logger ? logger : DefaultSilentLogger()),
      on_request_(std::move(on_request)),
      operations_(api_, registry_, logger_, model_query) {}

ToolProtocolFront::~ToolProtocolFront() {
  Stop();
}

bool ToolProtocolFront::Start(int port, std::string* err) {
  std::lock_guard<std::mutex> lock(mu_);
  if (running_.load()) {
    logger_->Warn("Server already running", {{"port", port_.load()}});
    return true;
  }

  McpServerInfo info;
  info.instructions = kServerInstructions;
  engine_ = std::make_unique<McpEngine>(tools_, std::move(info), logger_);
  RegisterTools();

  server_ = std::make_unique<httplib::Server>();
  server_->Post(kMcpEndpointPath, [this](const httplib::Request& req, httplib::Response& res) { HandleMcp(req, res); });

  server_->set_exception_handler([this](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
    std::string message = "unknown exception";
    if (ep) {
      try {
        std::rethrow_exception(ep);
      } catch (const std::exception& e) {
        message = e.what();
      } catch (...) {
        message = "non-standard exception";
      }
    }
    logger_->Error("Request failed", {{"path", req.path}, {"error", message}});
    SendJson(&res, 500, {{"error", message}});
  });

  server_->set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (!res.body.empty()) return;
    if (res.status == 404) res.set_content("Not Found", "text/plain");
  });

  if (!server_->bind_to_port("127.0.0.1", port)) {
    if (err) *err = "failed to bind 127.0.0.1:" + std::to_string(port);
    server_.reset();
    engine_.reset();
    tools_.Clear();
    return false;
  }

  accepting_.store(true);
  listen_thread_ = std::thread([this]() { server_->listen_after_bind(); });
  server_->wait_until_ready();
  if (!server_->is_running()) {
    accepting_.store(false);
    server_->stop();
    if (listen_thread_.joinable()) listen_thread_.join();
    server_.reset();
    engine_.reset();
    tools_.Clear();
    if (err) *err = "failed to listen on 127.0.0.1:" + std::to_string(port);
    return false;
  }

  port_.store(port);
  running_.store(true);
  logger_->Info("Started", {{"port", port}});
  return true;
}

void ToolProtocolFront::Stop() {
  std::lock_guard<std::mutex> lock(mu_);
  if (!server_) return;

  accepting_.store(false);
  if (engine_) engine_->Close();
  server_->stop();
  // listen_after_bind returns once in-flight handlers have drained.
  if (listen_thread_.joinable()) listen_thread_.join();
  server_.reset();
  engine_.reset();
  tools_.Clear();
  registry_.Clear();

  running_.store(false);
  port_.store(0);
  logger_->Info("Stopped");
}

void ToolProtocolFront::HandleMcp(const httplib::Request& req, httplib::Response& res) {
  if (!accepting_.load()) {
    SendJson(&res, 503, {{"error", "Server is shutting down"}});
    return;
  }

  const auto workspace_path = req.get_header_value(kWorkspacePathHeader);
  if (workspace_path.empty()) {
    logger_->Warn("Request without workspace path header", {{"remote", req.remote_addr}});
    SendJson(&res, 400, {{"error", std::string("Missing ") + kWorkspacePathHeader + " header"}});
    return;
  }

  if (on_request_) {
    try {
      on_request_(workspace_path);
    } catch (const std::exception& e) {
      logger_->Error("Request callback failed", {{"workspace", workspace_path}, {"error", std::string(e.what())}});
    }
  }

  auto message = nlohmann::json::parse(req.body, nullptr, false);
  if (message.is_discarded()) {
    SendJson(&res, 400, MakeJsonRpcError(nullptr, jsonrpc::kParseError, "Parse error"));
    return;
  }

  RequestContext ctx;
  ctx.workspace_path = workspace_path;
  auto reply = engine_->Dispatch(message, ctx);
  if (!reply) {
    res.status = 202;
    return;
  }
  SendJson(&res, 200, *reply);
}

void ToolProtocolFront::RegisterTools() {
  tools_.Clear();
  auto* ops = &operations_;

  tools_.RegisterTool({"workspace_get_status", "Get the current workspace status (dirty flag and agent status).",
                       ObjectSchema(nlohmann::json::object())},
                      [ops](const RequestContext& ctx, const nlohmann::json&) { return ops->GetStatus(ctx.workspace_path); });

  tools_.RegisterTool({"workspace_get_metadata", "Get all metadata for the current workspace.",
                       ObjectSchema(nlohmann::json::object())},
                      [ops](const RequestContext& ctx, const nlohmann::json&) { return ops->GetMetadata(ctx.workspace_path); });

  tools_.RegisterTool(
      {"workspace_set_metadata", "Set or delete a metadata key on the current workspace. Pass null to delete.",
       ObjectSchema({{"key",
                      {{"type", "string"},
                       {"minLength", 1},
                       {"maxLength", 64},
                       {"pattern", "^[A-Za-z][A-Za-z0-9-]*$"},
                       {"description", "Metadata key (letters, digits and dashes, starting with a letter)"}}},
                     {"value", {{"type", {"string", "null"}}, {"description", "Value to store, or null to delete the key"}}}},
                    {"key", "value"})},
      [ops](const RequestContext& ctx, const nlohmann::json& args) { return ops->SetMetadata(ctx.workspace_path, args); });

  tools_.RegisterTool({"workspace_get_agent_session",
                       "Get the agent session of the current workspace ({port, sessionId}), or null when none runs.",
                       ObjectSchema(nlohmann::json::object())},
                      [ops](const RequestContext& ctx, const nlohmann::json&) {
                        return ops->GetAgentSession(ctx.workspace_path);
                      });

  tools_.RegisterTool({"workspace_restart_agent_server",
                       "Restart the agent server of the current workspace. Returns the new port.",
                       ObjectSchema(nlohmann::json::object())},
                      [ops](const RequestContext& ctx, const nlohmann::json&) {
                        return ops->RestartAgentServer(ctx.workspace_path);
                      });

  nlohmann::json prompt_object =
      ObjectSchema({{"prompt", {{"type", "string"}, {"minLength", 1}}},
                    {"agent", {{"type", "string"}, {"description", "Agent mode, e.g. \"plan\" for read-only"}}},
                    {"model",
                     ObjectSchema({{"providerID", {{"type", "string"}}}, {"modelID", {{"type", "string"}}}},
                                  {"providerID", "modelID"})}},
                   {"prompt"});
  tools_.RegisterTool(
      {"workspace_create", "Create a new workspace in the same project as the caller. Returns the created workspace.",
       ObjectSchema({{"name", {{"type", "string"}, {"minLength", 1}, {"description", "Name of the new workspace (becomes the branch name)"}}},
                     {"base", {{"type", "string"}, {"minLength", 1}, {"description", "Base branch to create the workspace from"}}},
                     {"initialPrompt",
                      {{"anyOf", {{{"type", "string"}, {"minLength", 1}}, prompt_object}},
                       {"description", "Prompt sent to the new workspace's agent, a string or { prompt, agent? }"}}},
                     {"keepInBackground",
                      {{"type", "boolean"}, {"description", "Stay on the current workspace (default true)"}}}},
                    {"name", "base"})},
      [ops](const RequestContext& ctx, const nlohmann::json& args) { return ops->Create(ctx.workspace_path, args); });

  tools_.RegisterTool(
      {"workspace_delete", "Delete the current workspace. This terminates its agent session.",
       ObjectSchema({{"keepBranch",
                      {{"type", "boolean"}, {"default", false}, {"description", "Keep the git branch after removing the worktree"}}}})},
      [ops](const RequestContext& ctx, const nlohmann::json& args) { return ops->Delete(ctx.workspace_path, args); });

  tools_.RegisterTool(
      {"workspace_execute_command",
       "Execute an editor command in the current workspace. Most commands return null.",
       ObjectSchema({{"command",
                      {{"type", "string"}, {"minLength", 1}, {"maxLength", 256}, {"description", "Editor command identifier"}}},
                     {"args", {{"type", "array"}, {"description", "Command arguments"}}}},
                    {"command"})},
      [ops](const RequestContext& ctx, const nlohmann::json& args) {
        return ops->ExecuteCommand(ctx.workspace_path, args);
      });

  tools_.RegisterTool(
      {"log", "Write a structured log entry tagged with the current workspace.",
       ObjectSchema({{"level", {{"type", "string"}, {"enum", {"silly", "debug", "info", "warn", "error"}}}},
                     {"message", {{"type", "string"}, {"minLength", 1}}},
                     {"context",
                      {{"type", "object"},
                       {"additionalProperties", {{"type", {"string", "number", "boolean", "null"}}}}}}},
                    {"level", "message"})},
      [ops](const RequestContext& ctx, const nlohmann::json& args) { return ops->Log(ctx.workspace_path, args); });
}

}  // namespace bridge
