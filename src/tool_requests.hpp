#pragma once

#include "logging.hpp"
#include "workspace_api.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace bridge {

constexpr size_t kMetadataKeyMaxLength = 64;
constexpr size_t kCommandMaxLength = 256;

bool IsValidMetadataKey(const std::string& key);

struct SetMetadataRequest {
  std::string key;
  std::optional<std::string> value;
};

struct ExecuteCommandRequest {
  std::string command;
  nlohmann::json args = nlohmann::json::array();
};

struct DeleteWorkspaceRequest {
  bool keep_branch = false;
};

struct CreateWorkspaceRequest {
  std::string name;
  std::string base;
  std::optional<InitialPrompt> initial_prompt;
  bool keep_in_background = true;
};

struct LogRequest {
  LogLevel level = LogLevel::kInfo;
  std::string message;
  LogContext context = LogContext::object();
};

// Each parser returns nullopt and fills `err` with a caller-facing message
// when the payload is malformed.
std::optional<SetMetadataRequest> ParseSetMetadataRequest(const nlohmann::json& payload, std::string* err);
std::optional<ExecuteCommandRequest> ParseExecuteCommandRequest(const nlohmann::json& payload, std::string* err);
std::optional<DeleteWorkspaceRequest> ParseDeleteWorkspaceRequest(const nlohmann::json& payload, std::string* err);
std::optional<CreateWorkspaceRequest> ParseCreateWorkspaceRequest(const nlohmann::json& payload, std::string* err);
std::optional<LogRequest> ParseLogRequest(const nlohmann::json& payload, std::string* err);

// Accepts a bare string or {prompt, agent?, model?: {providerID, modelID}}.
std::optional<InitialPrompt> ParseInitialPrompt(const nlohmann::json& v, std::string* err);

}  // namespace bridge
