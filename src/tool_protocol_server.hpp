#pragma once

#include "agent_model_query.hpp"
#include "logging.hpp"
#include "mcp_engine.hpp"
#include "tool_registry.hpp"
#include "workspace_api.hpp"
#include "workspace_operations.hpp"
#include "workspace_registry.hpp"

#include <httplib.h>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace bridge {

constexpr const char* kWorkspacePathHeader = "X-Workspace-Path";
constexpr const char* kMcpEndpointPath = "/mcp";

extern const char* const kServerInstructions;

// HTTP front exposing the workspace tools over MCP (JSON-RPC) at POST /mcp
// on 127.0.0.1. Each request names its workspace in the X-Workspace-Path
// header; the path is handed to tools as request context.
class ToolProtocolFront {
 public:
  // Receives the raw header value of every request that passed the header check.
  using RequestCallback = std::function<void(const std::string& workspace_path)>;

  ToolProtocolFront(IWorkspaceApi& api,
                    Logger* logger = nullptr,
                    RequestCallback on_request = nullptr,
                    IAgentModelQuery* model_query = nullptr);
  ~ToolProtocolFront();
  ToolProtocolFront(const ToolProtocolFront&) = delete;
  ToolProtocolFront& operator=(const ToolProtocolFront&) = delete;

  bool Start(int port, std::string* err);
  // Refuses new requests, closes the engine, stops the listener and joins it.
  void Stop();
  bool IsRunning() const { return running_.load(); }
  int Port() const { return port_.load(); }

  WorkspaceIdentityRegistry& Registry() { return registry_; }
  void RegisterWorkspace(const WorkspaceIdentity& identity) { registry_.Register(identity); }
  void UnregisterWorkspace(const std::string& path) { registry_.Unregister(path); }

 private:
  void RegisterTools();
  void HandleMcp(const httplib::Request& req, httplib::Response& res);

  IWorkspaceApi& api_;
  Logger* logger_;
  RequestCallback on_request_;
  WorkspaceIdentityRegistry registry_;
  WorkspaceOperations operations_;
  ToolRegistry tools_;

  std::mutex mu_;
  std::unique_ptr<McpEngine> engine_;
  std::unique_ptr<httplib::Server> server_;
  std::thread listen_thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> accepting_{false};
  std::atomic<int> port_{0};
};

}  // namespace bridge
