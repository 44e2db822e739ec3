#include "workspace_registry.hpp"

#include "workspace_path.hpp"

#include <mutex>
#include <utility>

namespace bridge {

void WorkspaceIdentityRegistry::Register(const WorkspaceIdentity& identity) {
  const auto key = NormalizeWorkspacePath(identity.workspace_path);
  WorkspaceIdentity stored = identity;
  stored.workspace_path = key;
  std::unique_lock<std::shared_mutex> lock(mu_);
  entries_[key] = std::move(stored);
}

void WorkspaceIdentityRegistry::Unregister(const std::string& path) {
  const auto key = NormalizeWorkspacePath(path);
  std::unique_lock<std::shared_mutex> lock(mu_);
  entries_.erase(key);
}

std::optional<WorkspaceIdentity> WorkspaceIdentityRegistry::Resolve(const std::string& path) const {
  const auto key = NormalizeWorkspacePath(path);
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end()) return std::nullopt;
  return it->second;
}

size_t WorkspaceIdentityRegistry::Size() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return entries_.size();
}

void WorkspaceIdentityRegistry::Clear() {
  std::unique_lock<std::shared_mutex> lock(mu_);
  entries_.clear();
}

void PendingRegistrationQueue::Put(const WorkspaceIdentity& identity) {
  entries_[NormalizeWorkspacePath(identity.workspace_path)] = identity;
}

void PendingRegistrationQueue::Remove(const std::string& path) {
  entries_.erase(NormalizeWorkspacePath(path));
}

void PendingRegistrationQueue::DrainInto(WorkspaceIdentityRegistry* registry) {
  if (registry) {
    for (const auto& [_, identity] : entries_) registry->Register(identity);
  }
  entries_.clear();
}

}  // namespace bridge
