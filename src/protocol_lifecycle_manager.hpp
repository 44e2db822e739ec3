#pragma once

#include "agent_model_query.hpp"
#include "logging.hpp"
#include "port_allocator.hpp"
#include "tool_protocol_server.hpp"
#include "workspace_api.hpp"
#include "workspace_registry.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace bridge {

using FirstRequestCallback = std::function<void(const std::string& normalized_path)>;

// Owns the tool front's lifetime: port allocation, start/stop, the queue of
// registrations made while stopped, and the once-per-workspace first-request
// signal.
//
// Stopped -> Start() -> Running -> Stop() -> Stopped. A failed Start leaves
// the manager stopped with its queued registrations and subscribers intact.
// While running, Resolve() goes through the live registry, so other fronts
// can share the same identity table.
class ProtocolLifecycleManager : public WorkspaceResolver {
 public:
  ProtocolLifecycleManager(PortAllocator& ports,
                           IWorkspaceApi& api,
                           Logger* logger = nullptr,
                           IAgentModelQuery* model_query = nullptr);
  ~ProtocolLifecycleManager() override;
  ProtocolLifecycleManager(const ProtocolLifecycleManager&) = delete;
  ProtocolLifecycleManager& operator=(const ProtocolLifecycleManager&) = delete;

  // Returns the existing port without allocating when already running.
  std::optional<int> Start(std::string* err);
  // Safe to call when never started and to call twice.
  void Stop();
  void Dispose() { Stop(); }

  std::optional<int> GetPort() const;
  bool IsRunning() const;

  void RegisterWorkspace(const WorkspaceIdentity& identity);
  // Also forgets the path's first-request state.
  void UnregisterWorkspace(const std::string& path);

  // Subscribers run in registration order; the returned function must not
  // be called after the manager is destroyed.
  Unsubscribe OnFirstRequest(FirstRequestCallback callback);
  void ClearFirstRequestTracking(const std::string& path);

  std::optional<WorkspaceIdentity> Resolve(const std::string& path) const override;

  size_t PendingRegistrations() const;

 private:
  void StopLocked();
  void AbortStartLocked();
  void NotifyRequest(const std::string& raw_path);

  PortAllocator& ports_;
  IWorkspaceApi& api_;
  Logger* logger_;
  IAgentModelQuery* model_query_;

  std::mutex lifecycle_mu_;

  mutable std::mutex mu_;
  std::unique_ptr<ToolProtocolFront> front_;
  std::optional<int> port_;
  PendingRegistrationQueue pending_;
  std::unordered_set<std::string> seen_;
  std::vector<std::pair<uint64_t, FirstRequestCallback>> subscribers_;
  uint64_t next_subscriber_id_ = 1;
};

}  // namespace bridge
