#pragma once

#include "agent_model_query.hpp"
#include "logging.hpp"
#include "port_allocator.hpp"
#include "workspace_api.hpp"

#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace bridge::test {

// Records every call and returns scripted values. Setting `fail_with`
// makes every call throw std::runtime_error with that message.
class FakeWorkspaceApi : public IWorkspaceApi {
 public:
  struct Call {
    std::string op;
    std::string project_id;
    std::string workspace_name;
    nlohmann::json detail;
  };

  Workspace Create(const std::string& project_id,
                   const std::string& name,
                   const std::string& base,
                   const CreateWorkspaceOptions& options) override {
    nlohmann::json detail = {{"name", name}, {"base", base}, {"keepInBackground", options.keep_in_background}};
    if (options.initial_prompt) {
      nlohmann::json prompt = {{"prompt", options.initial_prompt->prompt}};
      if (options.initial_prompt->agent) prompt["agent"] = *options.initial_prompt->agent;
      if (options.initial_prompt->model) prompt["model"] = ToJson(*options.initial_prompt->model);
      detail["initialPrompt"] = prompt;
    }
    Record("create", project_id, "", detail);
    Workspace ws;
    ws.project_id = project_id;
    ws.name = name;
    ws.branch = name;
    ws.path = "/projects/" + project_id + "/" + name;
    return ws;
  }

  RemoveWorkspaceResult Remove(const std::string& project_id,
                               const std::string& workspace_name,
                               const RemoveWorkspaceOptions& options) override {
    Record("remove", project_id, workspace_name, {{"keepBranch", options.keep_branch}});
    return RemoveWorkspaceResult{true};
  }

  WorkspaceStatus GetStatus(const std::string& project_id, const std::string& workspace_name) override {
    Record("getStatus", project_id, workspace_name);
    return status;
  }

  std::map<std::string, std::string> GetMetadata(const std::string& project_id,
                                                 const std::string& workspace_name) override {
    Record("getMetadata", project_id, workspace_name);
    return metadata;
  }

  void SetMetadata(const std::string& project_id,
                   const std::string& workspace_name,
                   const std::string& key,
                   const std::optional<std::string>& value) override {
    Record("setMetadata", project_id, workspace_name,
           {{"key", key}, {"value", value ? nlohmann::json(*value) : nlohmann::json(nullptr)}});
  }

  std::optional<nlohmann::json> ExecuteCommand(const std::string& project_id,
                                               const std::string& workspace_name,
                                               const std::string& command,
                                               const nlohmann::json& args) override {
    Record("executeCommand", project_id, workspace_name, {{"command", command}, {"args", args}});
    return command_result;
  }

  std::optional<AgentSession> GetAgentSession(const std::string& project_id,
                                              const std::string& workspace_name) override {
    Record("getAgentSession", project_id, workspace_name);
    if (agent_session_error) throw std::runtime_error(*agent_session_error);
    return agent_session;
  }

  int RestartAgentServer(const std::string& project_id, const std::string& workspace_name) override {
    Record("restartAgentServer", project_id, workspace_name);
    return restart_port;
  }

  Unsubscribe On(const std::string& event, WorkspaceEventHandler handler) override {
    std::lock_guard<std::mutex> lock(mu_);
    handlers_[event].push_back(std::move(handler));
    return []() {};
  }

  void Dispose() override { disposed = true; }

  int CallCount() const {
    std::lock_guard<std::mutex> lock(mu_);
    return static_cast<int>(calls_.size());
  }

  int CallCount(const std::string& op) const {
    std::lock_guard<std::mutex> lock(mu_);
    int n = 0;
    for (const auto& c : calls_) {
      if (c.op == op) n++;
    }
    return n;
  }

  std::vector<Call> Calls() const {
    std::lock_guard<std::mutex> lock(mu_);
    return calls_;
  }

  std::optional<Call> LastCall(const std::string& op) const {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto it = calls_.rbegin(); it != calls_.rend(); ++it) {
      if (it->op == op) return *it;
    }
    return std::nullopt;
  }

  WorkspaceStatus status;
  std::map<std::string, std::string> metadata;
  std::optional<nlohmann::json> command_result;
  std::optional<AgentSession> agent_session;
  std::optional<std::string> agent_session_error;
  int restart_port = 0;
  std::optional<std::string> fail_with;
  bool disposed = false;

 private:
  void Record(const std::string& op,
              const std::string& project_id,
              const std::string& workspace_name,
              nlohmann::json detail = nlohmann::json::object()) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      calls_.push_back(Call{op, project_id, workspace_name, std::move(detail)});
    }
    if (fail_with) throw std::runtime_error(*fail_with);
  }

  mutable std::mutex mu_;
  std::vector<Call> calls_;
  std::map<std::string, std::vector<WorkspaceEventHandler>> handlers_;
};

class CapturingLogger : public Logger {
 public:
  struct Entry {
    LogLevel level;
    std::string message;
    LogContext context;
  };

  void Log(LogLevel level, const std::string& message, const LogContext& context) override {
    std::lock_guard<std::mutex> lock(mu_);
    entries_.push_back(Entry{level, message, context});
  }

  std::vector<Entry> Entries() const {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_;
  }

  std::vector<Entry> AtLevel(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<Entry> out;
    for (const auto& e : entries_) {
      if (e.level == level) out.push_back(e);
    }
    return out;
  }

  bool Contains(LogLevel level, const std::string& message) const {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& e : entries_) {
      if (e.level == level && e.message == message) return true;
    }
    return false;
  }

 private:
  mutable std::mutex mu_;
  std::vector<Entry> entries_;
};

// Hands out queued ports and errors in order; falls back to a real
// loopback port once the script is exhausted.
class ScriptedPortAllocator : public PortAllocator {
 public:
  std::optional<int> FindFreePort(std::string* err) override {
    calls++;
    std::optional<Step> step;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (!script_.empty()) {
        step = script_.front();
        script_.pop_front();
      }
    }
    if (!step) return fallback_.FindFreePort(err);
    if (step->port) return step->port;
    if (err) *err = step->error;
    return std::nullopt;
  }

  void FailNext(std::string message) {
    std::lock_guard<std::mutex> lock(mu_);
    script_.push_back(Step{std::nullopt, std::move(message)});
  }

  void HandOut(int port) {
    std::lock_guard<std::mutex> lock(mu_);
    script_.push_back(Step{port, {}});
  }

  std::atomic<int> calls{0};

 private:
  struct Step {
    std::optional<int> port;
    std::string error;
  };

  std::mutex mu_;
  std::deque<Step> script_;
  LoopbackPortAllocator fallback_;
};

// Holds a listening loopback socket so anything else binding its port fails.
// No reuse options are set, so even SO_REUSEPORT binds are refused.
class PortBlocker {
 public:
  PortBlocker() {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd_ < 0) return;
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    socklen_t len = sizeof(addr);
    if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(fd_, 1) != 0 ||
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
      ::close(fd_);
      fd_ = -1;
      return;
    }
    port_ = ntohs(addr.sin_port);
  }
  ~PortBlocker() {
    if (fd_ >= 0) ::close(fd_);
  }
  PortBlocker(const PortBlocker&) = delete;
  PortBlocker& operator=(const PortBlocker&) = delete;

  bool ok() const { return fd_ >= 0; }
  int port() const { return port_; }

 private:
  int fd_ = -1;
  int port_ = 0;
};

class FakeAgentModelQuery : public IAgentModelQuery {
 public:
  std::optional<PromptModel> LatestUserModel(int port, std::string* err) override {
    calls++;
    last_port = port;
    if (error && err) *err = *error;
    return model;
  }

  std::optional<PromptModel> model;
  std::optional<std::string> error;
  int calls = 0;
  int last_port = 0;
};

}  // namespace bridge::test
