#include "protocol_lifecycle_manager.hpp"

#include "workspace_path.hpp"

#include <exception>
#include <utility>

namespace bridge {

ProtocolLifecycleManager::ProtocolLifecycleManager(PortAllocator& ports,
                                                   IWorkspaceApi& api,
                                                   Logger* logger,
                                                   IAgentModelQuery* model_query)
    : ports_(ports), api_(api), logger_(logger ? logger : DefaultSilentLogger()), model_query_(model_query) {}

ProtocolLifecycleManager::~ProtocolLifecycleManager() {
  Stop();
}

std::optional<int> ProtocolLifecycleManager::Start(std::string* err) {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (front_ && front_->IsRunning()) {
      logger_->Warn("Server already running", {{"port", *port_}});
      return port_;
    }
  }

  std::string alloc_err;
  auto port = ports_.FindFreePort(&alloc_err);
  if (!port) {
    logger_->Error("Port allocation failed", {{"error", alloc_err}});
    if (err) *err = "port allocation failed: " + alloc_err;
    return std::nullopt;
  }
  logger_->Info("Allocated port", {{"port", *port}});

  ToolProtocolFront* front = nullptr;
  {
    std::lock_guard<std::mutex> lock(mu_);
    front_ = std::make_unique<ToolProtocolFront>(
        api_, logger_, [this](const std::string& path) { NotifyRequest(path); }, model_query_);
    // Everything registered while stopped becomes resolvable before the first request is served.
    // The queue itself is kept until the front is up so a failed start can be retried.
    PendingRegistrationQueue replay = pending_;
    replay.DrainInto(&front_->Registry());
    port_ = port;
    front = front_.get();
  }

  std::string start_err;
  if (!front->Start(*port, &start_err)) {
    AbortStartLocked();
    logger_->Error("Server start failed", {{"port", *port}, {"error", start_err}});
    if (err) *err = start_err;
    return std::nullopt;
  }

  {
    std::lock_guard<std::mutex> lock(mu_);
    pending_.Clear();
  }
  logger_->Info("Manager started", {{"port", *port}});
  return port;
}

void ProtocolLifecycleManager::Stop() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);
  StopLocked();
}

void ProtocolLifecycleManager::StopLocked() {
  std::unique_ptr<ToolProtocolFront> front;
  {
    std::lock_guard<std::mutex> lock(mu_);
    front = std::move(front_);
  }
  // Handlers may still call back into NotifyRequest while draining, so stop without holding mu_.
  if (front) front->Stop();
  front.reset();

  std::lock_guard<std::mutex> lock(mu_);
  port_.reset();
  seen_.clear();
  subscribers_.clear();
  pending_.Clear();
  logger_->Info("Manager stopped");
}

void ProtocolLifecycleManager::AbortStartLocked() {
  std::unique_ptr<ToolProtocolFront> front;
  {
    std::lock_guard<std::mutex> lock(mu_);
    front = std::move(front_);
    port_.reset();
  }
  if (front) front->Stop();
}

std::optional<int> ProtocolLifecycleManager::GetPort() const {
  std::lock_guard<std::mutex> lock(mu_);
  if (!front_ || !front_->IsRunning()) return std::nullopt;
  return port_;
}

bool ProtocolLifecycleManager::IsRunning() const {
  std::lock_guard<std::mutex> lock(mu_);
  return front_ && front_->IsRunning();
}

void ProtocolLifecycleManager::RegisterWorkspace(const WorkspaceIdentity& identity) {
  std::lock_guard<std::mutex> lock(mu_);
  if (front_) {
    front_->RegisterWorkspace(identity);
    // Still starting: keep it queued in case the start fails.
    if (!front_->IsRunning()) pending_.Put(identity);
  } else {
    pending_.Put(identity);
  }
}

void ProtocolLifecycleManager::UnregisterWorkspace(const std::string& path) {
  std::lock_guard<std::mutex> lock(mu_);
  if (front_) front_->UnregisterWorkspace(path);
  pending_.Remove(path);
  seen_.erase(NormalizeWorkspacePath(path));
}

Unsubscribe ProtocolLifecycleManager::OnFirstRequest(FirstRequestCallback callback) {
  std::lock_guard<std::mutex> lock(mu_);
  const uint64_t id = next_subscriber_id_++;
  subscribers_.emplace_back(id, std::move(callback));
  return [this, id]() {
    std::lock_guard<std::mutex> inner(mu_);
    for (auto it = subscribers_.begin(); it != subscribers_.end(); ++it) {
      if (it->first == id) {
        subscribers_.erase(it);
        return;
      }
    }
  };
}

void ProtocolLifecycleManager::ClearFirstRequestTracking(const std::string& path) {
  std::lock_guard<std::mutex> lock(mu_);
  seen_.erase(NormalizeWorkspacePath(path));
}

std::optional<WorkspaceIdentity> ProtocolLifecycleManager::Resolve(const std::string& path) const {
  std::lock_guard<std::mutex> lock(mu_);
  if (!front_ || !front_->IsRunning()) return std::nullopt;
  return front_->Registry().Resolve(path);
}

size_t ProtocolLifecycleManager::PendingRegistrations() const {
  std::lock_guard<std::mutex> lock(mu_);
  return pending_.Size();
}

void ProtocolLifecycleManager::NotifyRequest(const std::string& raw_path) {
  if (raw_path.empty()) return;
  const auto normalized = NormalizeWorkspacePath(raw_path);

  std::vector<FirstRequestCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!seen_.insert(normalized).second) return;
    callbacks.reserve(subscribers_.size());
    for (const auto& [_, cb] : subscribers_) callbacks.push_back(cb);
  }

  for (const auto& cb : callbacks) {
    try {
      cb(normalized);
    } catch (const std::exception& e) {
      logger_->Error("First request callback error", {{"workspace", normalized}, {"error", std::string(e.what())}});
    }
  }
}

}  // namespace bridge
