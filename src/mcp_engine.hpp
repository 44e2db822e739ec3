#pragma once

#include "logging.hpp"
#include "tool_registry.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <optional>
#include <string>

namespace bridge {

struct McpServerInfo {
  std::string name = "workspace-bridge";
  std::string version = "1.0.0";
  std::string instructions;
};

namespace jsonrpc {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
constexpr int kServerClosed = -32000;
}  // namespace jsonrpc

nlohmann::json MakeJsonRpcError(const nlohmann::json& id, int code, const std::string& message);

// Stateless JSON-RPC 2.0 dispatcher for the MCP tool methods.
// Requests carry a RequestContext so tool handlers see the caller's
// workspace without it being part of the arguments.
class McpEngine {
 public:
  McpEngine(const ToolRegistry& tools, McpServerInfo info, Logger* logger = nullptr);

  // Accepts a single message or a batch. Returns nullopt when nothing needs
  // to be sent back (notifications, client responses).
  std::optional<nlohmann::json> Dispatch(const nlohmann::json& message, const RequestContext& ctx);

  // After Close every request is answered with kServerClosed.
  void Close();
  bool IsClosed() const { return closed_.load(); }

 private:
  std::optional<nlohmann::json> DispatchOne(const nlohmann::json& message, const RequestContext& ctx);
  nlohmann::json HandleInitialize(const nlohmann::json& params) const;
  nlohmann::json HandleToolsList() const;
  nlohmann::json HandleToolsCall(const nlohmann::json& id, const nlohmann::json& params, const RequestContext& ctx);

  const ToolRegistry& tools_;
  McpServerInfo info_;
  Logger* logger_;
  std::atomic<bool> closed_{false};
};

}  // namespace bridge
