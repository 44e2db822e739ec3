#include "socket_protocol_server.hpp"

#include "tool_requests.hpp"
#include "workspace_path.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <exception>
#include <utility>

namespace bridge {
namespace {

static std::optional<int64_t> FrameId(const nlohmann::json& frame) {
  if (!frame.contains("id") || !frame["id"].is_number_integer()) return std::nullopt;
  return frame["id"].get<int64_t>();
}

static std::string FrameType(const nlohmann::json& frame) {
  if (!frame.is_object() || !frame.contains("type") || !frame["type"].is_string()) return {};
  return frame["type"].get<std::string>();
}

}  // namespace

SocketProtocolFront::SocketProtocolFront(PortAllocator& ports,
                                         IWorkspaceApi& api,
                                         const WorkspaceResolver& resolver,
                                         Logger* logger,
                                         Logger* extension_logger,
                                         SocketFrontOptions options)
    : ports_(ports),
      logger_(logger ? logger : DefaultSilentLogger()),
      extension_logger_(extension_logger ? extension_logger : logger_),
      options_(options),
      operations_(api, resolver, logger_) {}

SocketProtocolFront::~SocketProtocolFront() {
  Close();
}

std::optional<int> SocketProtocolFront::Start(std::string* err) {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);
  if (running_.load()) return port_.load();

  std::string alloc_err;
  auto port = ports_.FindFreePort(&alloc_err);
  if (!port) {
    if (err) *err = "port allocation failed: " + alloc_err;
    return std::nullopt;
  }

  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    if (err) *err = std::string("socket: ") + std::strerror(errno);
    return std::nullopt;
  }
  int yes = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = htons(static_cast<uint16_t>(*port));
  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
    if (err) *err = "bind 127.0.0.1:" + std::to_string(*port) + ": " + std::strerror(errno);
    ::close(fd);
    return std::nullopt;
  }
  if (::listen(fd, 16) != 0) {
    if (err) *err = std::string("listen: ") + std::strerror(errno);
    ::close(fd);
    return std::nullopt;
  }

  listen_fd_ = fd;
  port_.store(*port);
  {
    std::lock_guard<std::mutex> lock(task_mu_);
    stop_workers_ = false;
  }
  int worker_count = options_.worker_threads;
  if (worker_count < 1) worker_count = 1;
  if (worker_count > socket_protocol::kMaxWorkerThreads) worker_count = socket_protocol::kMaxWorkerThreads;
  workers_.reserve(static_cast<size_t>(worker_count));
  for (int i = 0; i < worker_count; i++) workers_.emplace_back([this]() { WorkerLoop(); });

  running_.store(true);
  accept_thread_ = std::thread([this]() { AcceptLoop(); });
  logger_->Info("Started", {{"port", *port}, {"workers", worker_count}});
  return *port;
}

void SocketProtocolFront::Close() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);
  if (!running_.load()) return;
  logger_->Info("Closing");

  running_.store(false);
  if (accept_thread_.joinable()) accept_thread_.join();
  ::close(listen_fd_);
  listen_fd_ = -1;

  std::vector<ConnectionPtr> open;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& [_, conn] : connections_) open.push_back(conn);
  }
  for (const auto& conn : open) Shutdown(*conn);

  {
    std::unique_lock<std::mutex> lock(work_mu_);
    work_cv_.wait(lock, [this]() { return active_work_ == 0; });
  }
  {
    std::lock_guard<std::mutex> lock(task_mu_);
    stop_workers_ = true;
  }
  task_cv_.notify_all();
  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
  workers_.clear();

  {
    std::lock_guard<std::mutex> lock(mu_);
    connections_.clear();
    by_path_.clear();
    connect_callbacks_.clear();
  }
  port_.store(0);
  logger_->Info("Closed");
}

std::optional<int> SocketProtocolFront::GetPort() const {
  if (!running_.load()) return std::nullopt;
  return port_.load();
}

bool SocketProtocolFront::IsConnected(const std::string& workspace_path) const {
  auto conn = FindByPath(NormalizeWorkspacePath(workspace_path));
  return conn && !conn->closed.load();
}

Unsubscribe SocketProtocolFront::OnConnect(ConnectCallback callback) {
  std::lock_guard<std::mutex> lock(mu_);
  const uint64_t id = next_callback_id_++;
  connect_callbacks_.emplace_back(id, std::move(callback));
  return [this, id]() {
    std::lock_guard<std::mutex> inner(mu_);
    for (auto it = connect_callbacks_.begin(); it != connect_callbacks_.end(); ++it) {
      if (it->first == id) {
        connect_callbacks_.erase(it);
        return;
      }
    }
  };
}

ToolResult SocketProtocolFront::SendCommand(const std::string& workspace_path,
                                            const std::string& command,
                                            const nlohmann::json& args,
                                            int timeout_ms) {
  if (timeout_ms < 0) timeout_ms = options_.command_timeout_ms;
  const auto normalized = NormalizeWorkspacePath(workspace_path);
  auto conn = FindByPath(normalized);
  if (!conn || conn->closed.load()) {
    return ToolFailure(ToolErrorCode::kInternalError, "Workspace not connected");
  }

  int64_t id = 0;
  {
    std::lock_guard<std::mutex> lock(conn->ack_mu);
    id = conn->next_request_id++;
    conn->acks[id] = std::nullopt;
  }

  nlohmann::json frame;
  frame["type"] = socket_protocol::kFrameCommand;
  frame["id"] = id;
  frame["request"] = {{"command", command}, {"args", args.is_array() ? args : nlohmann::json::array()}};
  logger_->Debug("Sending command", {{"workspace", normalized}, {"command", command}, {"id", id}});

  const bool sent = Send(*conn, frame);

  std::unique_lock<std::mutex> lock(conn->ack_mu);
  if (sent) {
    conn->ack_cv.wait_for(lock, std::chrono::milliseconds(timeout_ms), [&]() {
      return conn->acks[id].has_value() || conn->closed.load();
    });
  }
  auto answer = std::move(conn->acks[id]);
  conn->acks.erase(id);
  lock.unlock();

  if (answer) {
    auto r = FromEnvelope(*answer);
    logger_->Debug("Command result", {{"workspace", normalized}, {"command", command}, {"success", r.ok}});
    return r;
  }
  if (!sent || conn->closed.load()) {
    return ToolFailure(ToolErrorCode::kInternalError, "Workspace disconnected");
  }
  logger_->Warn("Command timed out", {{"workspace", normalized}, {"command", command}, {"timeoutMs", timeout_ms}});
  return ToolFailure(ToolErrorCode::kInternalError, "Command timed out");
}

void SocketProtocolFront::SendExtensionHostShutdown(const std::string& workspace_path, int timeout_ms) {
  const auto normalized = NormalizeWorkspacePath(workspace_path);
  if (!IsAbsoluteWorkspacePath(normalized)) {
    logger_->Warn("Shutdown skipped: invalid workspace path", {{"workspace", workspace_path}});
    return;
  }
  auto conn = FindByPath(normalized);
  if (!conn || conn->closed.load()) {
    logger_->Debug("Shutdown skipped: workspace not connected", {{"workspace", normalized}});
    return;
  }

  int64_t id = 0;
  {
    std::lock_guard<std::mutex> lock(conn->ack_mu);
    id = conn->next_request_id++;
    conn->acks[id] = std::nullopt;
  }
  logger_->Info("Sending shutdown", {{"workspace", normalized}});
  nlohmann::json frame;
  frame["type"] = socket_protocol::kFrameShutdown;
  frame["id"] = id;
  const bool sent = Send(*conn, frame);

  std::unique_lock<std::mutex> lock(conn->ack_mu);
  bool disconnected = !sent || conn->closed.load();
  if (!disconnected) {
    disconnected = conn->ack_cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                         [&]() { return conn->closed.load(); });
  }
  conn->acks.erase(id);
  lock.unlock();

  if (disconnected) {
    logger_->Info("Shutdown complete: socket disconnected", {{"workspace", normalized}});
  } else {
    logger_->Warn("Shutdown timeout: proceeding anyway", {{"workspace", normalized}, {"timeoutMs", timeout_ms}});
  }
}

void SocketProtocolFront::AcceptLoop() {
  while (running_.load()) {
    pollfd pfd{};
    pfd.fd = listen_fd_;
    pfd.events = POLLIN;
    const int r = ::poll(&pfd, 1, 200);
    if (r <= 0) continue;

    const int client_fd = ::accept(listen_fd_, nullptr, nullptr);
    if (client_fd < 0) {
      if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
        logger_->Warn("Accept failed", {{"error", std::string(std::strerror(errno))}});
      }
      continue;
    }

    auto conn = std::make_shared<Connection>();
    conn->fd = client_fd;
    {
      std::lock_guard<std::mutex> lock(mu_);
      conn->id = next_connection_id_++;
      connections_[conn->id] = conn;
    }
    BeginWork();
    std::thread([this, conn]() {
      ReadLoop(conn);
      EndWork();
    }).detach();
  }
}

void SocketProtocolFront::ReadLoop(ConnectionPtr conn) {
  FrameReader reader;
  char buf[4096];
  bool open = true;
  while (open) {
    const ssize_t n = ::recv(conn->fd, buf, sizeof(buf), 0);
    if (n == 0) break;
    if (n < 0) {
      if (errno == EINTR) continue;
      break;
    }
    reader.Append(buf, static_cast<size_t>(n));
    while (open) {
      auto line = reader.Next();
      if (!line) break;
      auto frame = nlohmann::json::parse(*line, nullptr, false);
      if (frame.is_discarded() || !frame.is_object()) {
        logger_->Warn("Invalid frame", {{"connection", conn->id}});
        open = !conn->workspace_path.empty();
        continue;
      }
      open = HandleFrame(conn, frame);
    }
    if (reader.Overflowed()) {
      logger_->Warn("Frame too large, closing connection",
                    {{"connection", conn->id}, {"limit", static_cast<int64_t>(socket_protocol::kMaxFrameBytes)}});
      break;
    }
  }
  Disconnect(conn);
}

bool SocketProtocolFront::HandleFrame(const ConnectionPtr& conn, const nlohmann::json& frame) {
  const auto type = FrameType(frame);
  if (conn->workspace_path.empty()) {
    if (type != socket_protocol::kFrameHello) {
      logger_->Warn("Connection rejected: invalid auth", {{"connection", conn->id}, {"type", type}});
      return false;
    }
    return HandleHello(conn, frame);
  }

  if (type == socket_protocol::kFrameCall) {
    HandleCall(conn, frame);
    return true;
  }
  if (type == socket_protocol::kFrameAck) {
    HandleAck(conn, frame);
    return true;
  }
  if (type == socket_protocol::kFrameEmit) {
    const auto event = frame.contains("event") && frame["event"].is_string() ? frame["event"].get<std::string>() : "";
    if (event != socket_protocol::kEventLog) {
      logger_->Debug("Ignoring emit", {{"workspace", conn->workspace_path}, {"event", event}});
      return true;
    }
    const nlohmann::json request = frame.contains("request") ? frame["request"] : nlohmann::json();
    std::string err;
    if (!ParseLogRequest(request, &err)) return true;
    operations_.Log(conn->workspace_path, request, extension_logger_);
    return true;
  }
  logger_->Debug("Ignoring frame", {{"workspace", conn->workspace_path}, {"type", type}});
  return true;
}

bool SocketProtocolFront::HandleHello(const ConnectionPtr& conn, const nlohmann::json& frame) {
  if (!frame.contains("workspacePath") || !frame["workspacePath"].is_string() ||
      frame["workspacePath"].get<std::string>().empty()) {
    logger_->Warn("Connection rejected: invalid auth", {{"connection", conn->id}});
    return false;
  }
  const auto raw = frame["workspacePath"].get<std::string>();
  if (!IsAbsoluteWorkspacePath(raw)) {
    logger_->Warn("Connection rejected: invalid path", {{"connection", conn->id}, {"workspace", raw}});
    return false;
  }
  const auto normalized = NormalizeWorkspacePath(raw);
  conn->workspace_path = normalized;

  ConnectionPtr previous;
  std::vector<ConnectCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = by_path_.find(normalized);
    if (it != by_path_.end() && it->second != conn) previous = it->second;
    by_path_[normalized] = conn;
    for (const auto& [_, cb] : connect_callbacks_) callbacks.push_back(cb);
  }
  if (previous) {
    logger_->Info("Disconnecting duplicate connection", {{"workspace", normalized}, {"connection", previous->id}});
    Shutdown(*previous);
  }
  logger_->Info("Client connected", {{"workspace", normalized}, {"connection", conn->id}});

  nlohmann::json config_frame;
  config_frame["type"] = socket_protocol::kFrameConfig;
  config_frame["config"] = ToJson(options_.config);
  if (Send(*conn, config_frame)) {
    logger_->Debug("Config sent", {{"workspace", normalized}, {"isDevelopment", options_.config.is_development}});
  }

  if (callbacks.empty()) return true;
  // Callbacks may wait on this client's acks, which only this reader can deliver.
  Post([this, callbacks = std::move(callbacks), normalized]() {
    for (const auto& cb : callbacks) {
      try {
        cb(normalized);
      } catch (const std::exception& e) {
        logger_->Error("Connect callback error", {{"workspace", normalized}, {"error", std::string(e.what())}});
      }
    }
  });
  return true;
}

void SocketProtocolFront::HandleCall(const ConnectionPtr& conn, const nlohmann::json& frame) {
  auto id = FrameId(frame);
  if (!id) {
    logger_->Warn("Call without id", {{"workspace", conn->workspace_path}});
    return;
  }
  const auto event = frame.contains("event") && frame["event"].is_string() ? frame["event"].get<std::string>() : "";
  const nlohmann::json request = frame.contains("request") ? frame["request"] : nlohmann::json();

  Post([this, conn, call_id = *id, event, request]() {
    logger_->Debug("API call", {{"workspace", conn->workspace_path}, {"event", event}});
    ToolResult r = DispatchCall(conn->workspace_path, event, request);
    nlohmann::json out;
    out["type"] = socket_protocol::kFrameResult;
    out["id"] = call_id;
    out["result"] = ToEnvelope(r);
    Send(*conn, out);
  });
}

void SocketProtocolFront::HandleAck(const ConnectionPtr& conn, const nlohmann::json& frame) {
  auto id = FrameId(frame);
  if (!id) return;
  std::lock_guard<std::mutex> lock(conn->ack_mu);
  auto it = conn->acks.find(*id);
  if (it == conn->acks.end()) {
    logger_->Debug("Unexpected ack", {{"workspace", conn->workspace_path}, {"id", *id}});
    return;
  }
  it->second = frame.contains("result") ? frame["result"] : nlohmann::json();
  conn->ack_cv.notify_all();
}

ToolResult SocketProtocolFront::DispatchCall(const std::string& workspace_path,
                                             const std::string& event,
                                             const nlohmann::json& request) {
  namespace sp = socket_protocol;
  if (event == sp::kEventGetStatus) return operations_.GetStatus(workspace_path);
  if (event == sp::kEventGetMetadata) return operations_.GetMetadata(workspace_path);
  if (event == sp::kEventSetMetadata) return operations_.SetMetadata(workspace_path, request);
  if (event == sp::kEventGetAgentSession) return operations_.GetAgentSession(workspace_path);
  if (event == sp::kEventDelete) return operations_.Delete(workspace_path, request);
  if (event == sp::kEventExecuteCommand) return operations_.ExecuteCommand(workspace_path, request);
  if (event == sp::kEventCreate) return operations_.Create(workspace_path, request);
  logger_->Warn("Unknown event", {{"workspace", workspace_path}, {"event", event}});
  return ToolFailure(ToolErrorCode::kInvalidInput, "Unknown event: " + event);
}

bool SocketProtocolFront::Send(Connection& conn, const nlohmann::json& frame) {
  const auto data = EncodeFrame(frame);
  std::lock_guard<std::mutex> lock(conn.write_mu);
  if (conn.closed.load()) return false;
  size_t off = 0;
  while (off < data.size()) {
    const ssize_t n = ::send(conn.fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    off += static_cast<size_t>(n);
  }
  return true;
}

void SocketProtocolFront::Shutdown(Connection& conn) {
  std::lock_guard<std::mutex> lock(conn.write_mu);
  if (conn.closed.load()) return;
  // Wakes the reader blocked in recv; it closes the descriptor on its way out.
  ::shutdown(conn.fd, SHUT_RDWR);
}

void SocketProtocolFront::Disconnect(const ConnectionPtr& conn) {
  {
    std::lock_guard<std::mutex> lock(conn->write_mu);
    conn->closed.store(true);
    ::close(conn->fd);
    conn->fd = -1;
  }
  {
    std::lock_guard<std::mutex> lock(conn->ack_mu);
    conn->ack_cv.notify_all();
  }
  {
    std::lock_guard<std::mutex> lock(mu_);
    connections_.erase(conn->id);
    if (!conn->workspace_path.empty()) {
      auto it = by_path_.find(conn->workspace_path);
      if (it != by_path_.end() && it->second == conn) by_path_.erase(it);
    }
  }
  if (!conn->workspace_path.empty()) {
    logger_->Info("Client disconnected", {{"workspace", conn->workspace_path}, {"connection", conn->id}});
  }
}

SocketProtocolFront::ConnectionPtr SocketProtocolFront::FindByPath(const std::string& normalized_path) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = by_path_.find(normalized_path);
  if (it == by_path_.end()) return nullptr;
  return it->second;
}

void SocketProtocolFront::BeginWork() {
  std::lock_guard<std::mutex> lock(work_mu_);
  active_work_++;
}

void SocketProtocolFront::EndWork() {
  std::lock_guard<std::mutex> lock(work_mu_);
  active_work_--;
  work_cv_.notify_all();
}

void SocketProtocolFront::Post(std::function<void()> task) {
  BeginWork();
  {
    std::lock_guard<std::mutex> lock(task_mu_);
    tasks_.push_back(std::move(task));
  }
  task_cv_.notify_one();
}

void SocketProtocolFront::WorkerLoop() {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(task_mu_);
      task_cv_.wait(lock, [this]() { return stop_workers_ || !tasks_.empty(); });
      if (tasks_.empty()) return;
      task = std::move(tasks_.front());
      tasks_.pop_front();
    }
    try {
      task();
    } catch (const std::exception& e) {
      logger_->Error("Worker task failed", {{"error", std::string(e.what())}});
    }
    EndWork();
  }
}

}  // namespace bridge
