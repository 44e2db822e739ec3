#pragma once

#include "logging.hpp"
#include "port_allocator.hpp"
#include "socket_protocol.hpp"
#include "tool_result.hpp"
#include "workspace_api.hpp"
#include "workspace_operations.hpp"
#include "workspace_registry.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace bridge {

struct SocketFrontOptions {
  PluginConfig config;
  int command_timeout_ms = socket_protocol::kCommandTimeoutMs;
  // Clamped to [1, kMaxWorkerThreads].
  int worker_threads = socket_protocol::kDefaultWorkerThreads;
};

// Persistent-connection front for editor clients. Each client introduces
// itself with a hello frame naming its workspace path; calls on that
// connection act on that workspace through the shared resolver.
//
// Threads: one accept thread, one reader per connection and a fixed pool of
// `worker_threads` workers. Calls and connect callbacks run on the pool, never
// on a reader, so anything waiting on a client's answer (SendCommand) leaves
// that client's reader free to deliver it. Work beyond the pool size queues.
class SocketProtocolFront {
 public:
  using ConnectCallback = std::function<void(const std::string& workspace_path)>;

  SocketProtocolFront(PortAllocator& ports,
                      IWorkspaceApi& api,
                      const WorkspaceResolver& resolver,
                      Logger* logger = nullptr,
                      Logger* extension_logger = nullptr,
                      SocketFrontOptions options = SocketFrontOptions());
  ~SocketProtocolFront();
  SocketProtocolFront(const SocketProtocolFront&) = delete;
  SocketProtocolFront& operator=(const SocketProtocolFront&) = delete;

  std::optional<int> Start(std::string* err);
  // Disconnects every client, waits for in-flight calls and closes the listener.
  void Close();
  std::optional<int> GetPort() const;
  bool IsRunning() const { return running_.load(); }

  bool IsConnected(const std::string& workspace_path) const;
  Unsubscribe OnConnect(ConnectCallback callback);

  // Runs an editor command on the client connected for `workspace_path`
  // and returns the client's answer.
  ToolResult SendCommand(const std::string& workspace_path,
                         const std::string& command,
                         const nlohmann::json& args = nlohmann::json::array(),
                         int timeout_ms = -1);
  // Best effort: asks the client to shut down and waits for it to disconnect.
  void SendExtensionHostShutdown(const std::string& workspace_path,
                                 int timeout_ms = socket_protocol::kShutdownTimeoutMs);

 private:
  struct Connection {
    int fd = -1;
    uint64_t id = 0;
    std::string workspace_path;

    std::mutex write_mu;
    std::atomic<bool> closed{false};

    std::mutex ack_mu;
    std::condition_variable ack_cv;
    std::unordered_map<int64_t, std::optional<nlohmann::json>> acks;
    int64_t next_request_id = 1;
  };
  using ConnectionPtr = std::shared_ptr<Connection>;

  void AcceptLoop();
  void ReadLoop(ConnectionPtr conn);
  bool HandleFrame(const ConnectionPtr& conn, const nlohmann::json& frame);
  bool HandleHello(const ConnectionPtr& conn, const nlohmann::json& frame);
  void HandleCall(const ConnectionPtr& conn, const nlohmann::json& frame);
  void HandleAck(const ConnectionPtr& conn, const nlohmann::json& frame);
  ToolResult DispatchCall(const std::string& workspace_path, const std::string& event, const nlohmann::json& request);

  bool Send(Connection& conn, const nlohmann::json& frame);
  void Shutdown(Connection& conn);
  void Disconnect(const ConnectionPtr& conn);
  ConnectionPtr FindByPath(const std::string& normalized_path) const;

  void BeginWork();
  void EndWork();
  // Queues `task` for the worker pool; counted as in-flight work until it returns.
  void Post(std::function<void()> task);
  void WorkerLoop();

  PortAllocator& ports_;
  Logger* logger_;
  Logger* extension_logger_;
  SocketFrontOptions options_;
  WorkspaceOperations operations_;

  std::mutex lifecycle_mu_;
  int listen_fd_ = -1;
  std::thread accept_thread_;
  std::atomic<bool> running_{false};
  std::atomic<int> port_{0};

  mutable std::mutex mu_;
  std::unordered_map<uint64_t, ConnectionPtr> connections_;
  std::unordered_map<std::string, ConnectionPtr> by_path_;
  std::vector<std::pair<uint64_t, ConnectCallback>> connect_callbacks_;
  uint64_t next_connection_id_ = 1;
  uint64_t next_callback_id_ = 1;

  std::mutex work_mu_;
  std::condition_variable work_cv_;
  int active_work_ = 0;

  std::mutex task_mu_;
  std::condition_variable task_cv_;
  std::deque<std::function<void()>> tasks_;
  std::vector<std::thread> workers_;
  bool stop_workers_ = false;
};

}  // namespace bridge
