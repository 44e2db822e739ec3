#include "tool_result.hpp"

#include <optional>
#include <utility>

namespace bridge {
namespace {

static nlohmann::json ErrorObject(const ToolResult& r) {
  return {{"code", ToolErrorCodeName(r.error_code)}, {"message", r.error_message}};
}

static std::optional<ToolErrorCode> ParseErrorCode(const std::string& s) {
  if (s == "workspace-not-found") return ToolErrorCode::kWorkspaceNotFound;
  if (s == "invalid-input") return ToolErrorCode::kInvalidInput;
  if (s == "internal-error") return ToolErrorCode::kInternalError;
  return std::nullopt;
}

}  // namespace

const char* ToolErrorCodeName(ToolErrorCode code) {
  switch (code) {
    case ToolErrorCode::kWorkspaceNotFound:
      return "workspace-not-found";
    case ToolErrorCode::kInvalidInput:
      return "invalid-input";
    case ToolErrorCode::kInternalError:
      return "internal-error";
  }
  return "internal-error";
}

ToolResult ToolSuccess(nlohmann::json data) {
  ToolResult r;
  r.ok = true;
  if (data.is_discarded()) data = nullptr;
  r.data = std::move(data);
  return r;
}

ToolResult ToolVoid() {
  return ToolSuccess(nullptr);
}

ToolResult ToolFailure(ToolErrorCode code, std::string message) {
  ToolResult r;
  r.ok = false;
  r.error_code = code;
  r.error_message = std::move(message);
  return r;
}

nlohmann::json ToMcpCallResult(const ToolResult& r) {
  nlohmann::json part;
  part["type"] = "text";
  nlohmann::json out;
  if (r.ok) {
    part["text"] = r.data.dump();
    out["content"] = nlohmann::json::array({part});
    return out;
  }
  part["text"] = nlohmann::json{{"error", ErrorObject(r)}}.dump();
  out["content"] = nlohmann::json::array({part});
  out["isError"] = true;
  return out;
}

nlohmann::json ToEnvelope(const ToolResult& r) {
  if (r.ok) return {{"success", true}, {"data", r.data}};
  return {{"success", false}, {"error", ErrorObject(r)}};
}

ToolResult FromEnvelope(const nlohmann::json& envelope) {
  if (!envelope.is_object() || !envelope.contains("success") || !envelope["success"].is_boolean()) {
    return ToolFailure(ToolErrorCode::kInternalError, "Invalid result envelope");
  }
  if (envelope["success"].get<bool>()) {
    return ToolSuccess(envelope.contains("data") ? envelope["data"] : nlohmann::json(nullptr));
  }
  const auto& e = envelope.contains("error") ? envelope["error"] : nlohmann::json();
  std::string message = "Unknown error";
  ToolErrorCode code = ToolErrorCode::kInternalError;
  if (e.is_string()) {
    message = e.get<std::string>();
  } else if (e.is_object()) {
    if (e.contains("message") && e["message"].is_string()) message = e["message"].get<std::string>();
    if (e.contains("code") && e["code"].is_string()) {
      if (auto c = ParseErrorCode(e["code"].get<std::string>())) code = *c;
    }
  }
  return ToolFailure(code, std::move(message));
}

}  // namespace bridge
