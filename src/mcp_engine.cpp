#include "mcp_engine.hpp"

#include <exception>
#include <utility>

namespace bridge {
namespace {

static const char* const kSupportedProtocolVersions[] = {"2025-06-18", "2025-03-26", "2024-11-05"};

static bool IsValidId(const nlohmann::json& id) {
  return id.is_string() || id.is_number_integer() || id.is_number_unsigned() || id.is_null();
}

static nlohmann::json MakeJsonRpcResult(const nlohmann::json& id, nlohmann::json result) {
  nlohmann::json out;
  out["jsonrpc"] = "2.0";
  out["id"] = id;
  out["result"] = std::move(result);
  return out;
}

}  // namespace

nlohmann::json MakeJsonRpcError(const nlohmann::json& id, int code, const std::string& message) {
  nlohmann::json out;
  out["jsonrpc"] = "2.0";
  out["id"] = id;
  out["error"] = {{"code", code}, {"message", message}};
  return out;
}

McpEngine::McpEngine(const ToolRegistry& tools, McpServerInfo info, Logger* logger)
    : tools_(tools), info_(std::move(info)), logger_(logger ? logger : DefaultSilentLogger()) {}

void McpEngine::Close() {
  closed_.store(true);
}

std::optional<nlohmann::json> McpEngine::Dispatch(const nlohmann::json& message, const RequestContext& ctx) {
  if (!message.is_array()) return DispatchOne(message, ctx);
  if (message.empty()) return MakeJsonRpcError(nullptr, jsonrpc::kInvalidRequest, "Invalid Request: empty batch");

  nlohmann::json responses = nlohmann::json::array();
  for (const auto& m : message) {
    auto r = DispatchOne(m, ctx);
    if (r) responses.push_back(std::move(*r));
  }
  if (responses.empty()) return std::nullopt;
  return responses;
}

std::optional<nlohmann::json> McpEngine::DispatchOne(const nlohmann::json& message, const RequestContext& ctx) {
  if (!message.is_object()) return MakeJsonRpcError(nullptr, jsonrpc::kInvalidRequest, "Invalid Request");

  const bool has_id = message.contains("id");
  const nlohmann::json id = has_id && IsValidId(message["id"]) ? message["id"] : nlohmann::json(nullptr);

  if (!message.contains("method")) {
    // A response from the client to a server request; nothing is ever sent, so drop it.
    if (message.contains("result") || message.contains("error")) return std::nullopt;
    return MakeJsonRpcError(id, jsonrpc::kInvalidRequest, "Invalid Request");
  }
  if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0" || !message["method"].is_string() ||
      (has_id && !IsValidId(message["id"]))) {
    return MakeJsonRpcError(id, jsonrpc::kInvalidRequest, "Invalid Request");
  }

  const auto method = message["method"].get<std::string>();
  const nlohmann::json params = message.contains("params") ? message["params"] : nlohmann::json::object();

  if (!has_id) {
    logger_->Silly("Notification", {{"method", method}});
    return std::nullopt;
  }
  if (closed_.load()) return MakeJsonRpcError(id, jsonrpc::kServerClosed, "Server is shutting down");

  if (method == "initialize") return MakeJsonRpcResult(id, HandleInitialize(params));
  if (method == "ping") return MakeJsonRpcResult(id, nlohmann::json::object());
  if (method == "tools/list") return MakeJsonRpcResult(id, HandleToolsList());
  if (method == "tools/call") return HandleToolsCall(id, params, ctx);

  return MakeJsonRpcError(id, jsonrpc::kMethodNotFound, "Method not found: " + method);
}

nlohmann::json McpEngine::HandleInitialize(const nlohmann::json& params) const {
  std::string version = kSupportedProtocolVersions[0];
  if (params.is_object() && params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
    const auto requested = params["protocolVersion"].get<std::string>();
    for (const char* v : kSupportedProtocolVersions) {
      if (requested == v) version = requested;
    }
  }
  nlohmann::json result;
  result["protocolVersion"] = version;
  result["capabilities"] = {{"tools", nlohmann::json::object()}};
  result["serverInfo"] = {{"name", info_.name}, {"version", info_.version}};
  if (!info_.instructions.empty()) result["instructions"] = info_.instructions;
  return result;
}

nlohmann::json McpEngine::HandleToolsList() const {
  nlohmann::json tools = nlohmann::json::array();
  for (const auto& schema : tools_.ListSchemas()) tools.push_back(ToolSchemaToJson(schema));
  return {{"tools", std::move(tools)}};
}

nlohmann::json McpEngine::HandleToolsCall(const nlohmann::json& id,
                                          const nlohmann::json& params,
                                          const RequestContext& ctx) {
  if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
    return MakeJsonRpcError(id, jsonrpc::kInvalidParams, "Invalid params: missing tool name");
  }
  const auto name = params["name"].get<std::string>();
  nlohmann::json arguments = nlohmann::json::object();
  if (params.contains("arguments") && !params["arguments"].is_null()) {
    if (!params["arguments"].is_object()) {
      return MakeJsonRpcError(id, jsonrpc::kInvalidParams, "Invalid params: arguments must be an object");
    }
    arguments = params["arguments"];
  }

  auto handler = tools_.GetHandler(name);
  if (!handler) return MakeJsonRpcError(id, jsonrpc::kInvalidParams, "Unknown tool: " + name);

  ToolResult r;
  try {
    r = (*handler)(ctx, arguments);
  } catch (const std::exception& e) {
    logger_->Error("Tool handler threw", {{"tool", name}, {"error", std::string(e.what())}});
    r = ToolFailure(ToolErrorCode::kInternalError, e.what());
  }
  return MakeJsonRpcResult(id, ToMcpCallResult(r));
}

}  // namespace bridge
