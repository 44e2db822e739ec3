#pragma once

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace bridge {

struct WorkspaceIdentity {
  std::string project_id;
  std::string workspace_name;
  std::string workspace_path;
};

class WorkspaceResolver {
 public:
  virtual ~WorkspaceResolver() = default;
  virtual std::optional<WorkspaceIdentity> Resolve(const std::string& path) const = 0;
};

// Normalized workspace path -> identity. Safe to use from several threads.
class WorkspaceIdentityRegistry : public WorkspaceResolver {
 public:
  WorkspaceIdentityRegistry() = default;
  WorkspaceIdentityRegistry(const WorkspaceIdentityRegistry&) = delete;
  WorkspaceIdentityRegistry& operator=(const WorkspaceIdentityRegistry&) = delete;

  // Replaces any identity previously stored under the same normalized path.
  void Register(const WorkspaceIdentity& identity);
  void Unregister(const std::string& path);
  std::optional<WorkspaceIdentity> Resolve(const std::string& path) const override;

  size_t Size() const;
  void Clear();

 private:
  mutable std::shared_mutex mu_;
  std::unordered_map<std::string, WorkspaceIdentity> entries_;
};

// Registrations accepted while the tool front is not running.
class PendingRegistrationQueue {
 public:
  void Put(const WorkspaceIdentity& identity);
  void Remove(const std::string& path);
  size_t Size() const { return entries_.size(); }
  void Clear() { entries_.clear(); }

  // Moves every queued identity into `registry`; the queue is empty afterwards.
  void DrainInto(WorkspaceIdentityRegistry* registry);

 private:
  std::unordered_map<std::string, WorkspaceIdentity> entries_;
};

}  // namespace bridge
