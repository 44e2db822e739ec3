#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace bridge {

enum class ToolErrorCode {
  kWorkspaceNotFound,
  kInvalidInput,
  kInternalError,
};

const char* ToolErrorCodeName(ToolErrorCode code);

// Either ok with `data` (null when the operation produced no value), or a
// failure carrying a code from the closed taxonomy and a message.
struct ToolResult {
  bool ok = true;
  nlohmann::json data;
  ToolErrorCode error_code = ToolErrorCode::kInternalError;
  std::string error_message;
};

ToolResult ToolSuccess(nlohmann::json data);
ToolResult ToolVoid();
ToolResult ToolFailure(ToolErrorCode code, std::string message);

// {"content":[{"type":"text","text":...}]} plus "isError" on failure.
nlohmann::json ToMcpCallResult(const ToolResult& r);

// {"success":true,"data":...} or {"success":false,"error":{"code","message"}}.
nlohmann::json ToEnvelope(const ToolResult& r);

// Inverse of ToEnvelope; malformed envelopes become internal errors.
ToolResult FromEnvelope(const nlohmann::json& envelope);

}  // namespace bridge
