#include "tool_requests.hpp"

#include <cctype>
#include <utility>

namespace bridge {
namespace {

static bool IsBlank(const std::string& s) {
  for (char c : s) {
    if (!std::isspace(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

static bool Fail(std::string* err, const std::string& message) {
  if (err) *err = message;
  return false;
}

static bool IsPrimitive(const nlohmann::json& v) {
  return v.is_string() || v.is_number() || v.is_boolean() || v.is_null();
}

}  // namespace

bool IsValidMetadataKey(const std::string& key) {
  if (key.empty() || key.size() > kMetadataKeyMaxLength) return false;
  if (!std::isalpha(static_cast<unsigned char>(key.front()))) return false;
  for (char c : key) {
    const auto u = static_cast<unsigned char>(c);
    if (u >= 0x80) return false;
    if (!std::isalnum(u) && c != '-') return false;
  }
  return key.back() != '-';
}

std::optional<SetMetadataRequest> ParseSetMetadataRequest(const nlohmann::json& payload, std::string* err) {
  if (!payload.is_object()) {
    Fail(err, "Request must be an object");
    return std::nullopt;
  }
  if (!payload.contains("key")) {
    Fail(err, "Missing required field: key");
    return std::nullopt;
  }
  if (!payload["key"].is_string()) {
    Fail(err, "Field 'key' must be a string");
    return std::nullopt;
  }
  SetMetadataRequest out;
  out.key = payload["key"].get<std::string>();
  if (out.key.empty()) {
    Fail(err, "Field 'key' cannot be empty");
    return std::nullopt;
  }
  if (!IsValidMetadataKey(out.key)) {
    Fail(err, "Invalid key format: must match /^[A-Za-z][A-Za-z0-9-]*$/");
    return std::nullopt;
  }
  if (!payload.contains("value")) {
    Fail(err, "Missing required field: value");
    return std::nullopt;
  }
  const auto& value = payload["value"];
  if (value.is_string()) {
    out.value = value.get<std::string>();
  } else if (!value.is_null()) {
    Fail(err, "Field 'value' must be a string or null");
    return std::nullopt;
  }
  return out;
}

std::optional<ExecuteCommandRequest> ParseExecuteCommandRequest(const nlohmann::json& payload, std::string* err) {
  if (!payload.is_object()) {
    Fail(err, "Request must be an object");
    return std::nullopt;
  }
  if (!payload.contains("command")) {
    Fail(err, "Missing required field: command");
    return std::nullopt;
  }
  if (!payload["command"].is_string()) {
    Fail(err, "Field 'command' must be a string");
    return std::nullopt;
  }
  ExecuteCommandRequest out;
  out.command = payload["command"].get<std::string>();
  if (out.command.empty() || IsBlank(out.command)) {
    Fail(err, "Field 'command' cannot be empty");
    return std::nullopt;
  }
  if (out.command.size() > kCommandMaxLength) {
    Fail(err, "Field 'command' must be at most 256 characters");
    return std::nullopt;
  }
  if (payload.contains("args") && !payload["args"].is_null()) {
    if (!payload["args"].is_array()) {
      Fail(err, "Field 'args' must be an array");
      return std::nullopt;
    }
    out.args = payload["args"];
  }
  return out;
}

std::optional<DeleteWorkspaceRequest> ParseDeleteWorkspaceRequest(const nlohmann::json& payload, std::string* err) {
  DeleteWorkspaceRequest out;
  if (payload.is_null()) return out;
  if (!payload.is_object()) {
    Fail(err, "Request must be an object");
    return std::nullopt;
  }
  if (payload.contains("keepBranch") && !payload["keepBranch"].is_null()) {
    if (!payload["keepBranch"].is_boolean()) {
      Fail(err, "Field 'keepBranch' must be a boolean");
      return std::nullopt;
    }
    out.keep_branch = payload["keepBranch"].get<bool>();
  }
  return out;
}

std::optional<InitialPrompt> ParseInitialPrompt(const nlohmann::json& v, std::string* err) {
  InitialPrompt out;
  if (v.is_string()) {
    out.prompt = v.get<std::string>();
  } else if (v.is_object()) {
    if (!v.contains("prompt") || !v["prompt"].is_string()) {
      Fail(err, "Field 'initialPrompt.prompt' must be a string");
      return std::nullopt;
    }
    out.prompt = v["prompt"].get<std::string>();
    if (v.contains("agent") && !v["agent"].is_null()) {
      if (!v["agent"].is_string()) {
        Fail(err, "Field 'initialPrompt.agent' must be a string");
        return std::nullopt;
      }
      out.agent = v["agent"].get<std::string>();
    }
    if (v.contains("model") && !v["model"].is_null()) {
      const auto& m = v["model"];
      if (!m.is_object() || !m.contains("providerID") || !m["providerID"].is_string() || !m.contains("modelID") ||
          !m["modelID"].is_string()) {
        Fail(err, "Field 'initialPrompt.model' must be {providerID, modelID}");
        return std::nullopt;
      }
      out.model = PromptModel{m["providerID"].get<std::string>(), m["modelID"].get<std::string>()};
    }
  } else {
    Fail(err, "Field 'initialPrompt' must be a string or an object");
    return std::nullopt;
  }
  if (out.prompt.empty()) {
    Fail(err, "Field 'initialPrompt' cannot be empty");
    return std::nullopt;
  }
  return out;
}

std::optional<CreateWorkspaceRequest> ParseCreateWorkspaceRequest(const nlohmann::json& payload, std::string* err) {
  if (!payload.is_object()) {
    Fail(err, "Request must be an object");
    return std::nullopt;
  }
  CreateWorkspaceRequest out;
  for (const char* field : {"name", "base"}) {
    if (!payload.contains(field)) {
      Fail(err, std::string("Missing required field: ") + field);
      return std::nullopt;
    }
    if (!payload[field].is_string()) {
      Fail(err, std::string("Field '") + field + "' must be a string");
      return std::nullopt;
    }
    if (payload[field].get<std::string>().empty()) {
      Fail(err, std::string("Field '") + field + "' cannot be empty");
      return std::nullopt;
    }
  }
  out.name = payload["name"].get<std::string>();
  out.base = payload["base"].get<std::string>();
  if (payload.contains("initialPrompt") && !payload["initialPrompt"].is_null()) {
    auto prompt = ParseInitialPrompt(payload["initialPrompt"], err);
    if (!prompt) return std::nullopt;
    out.initial_prompt = std::move(prompt);
  }
  if (payload.contains("keepInBackground") && !payload["keepInBackground"].is_null()) {
    if (!payload["keepInBackground"].is_boolean()) {
      Fail(err, "Field 'keepInBackground' must be a boolean");
      return std::nullopt;
    }
    out.keep_in_background = payload["keepInBackground"].get<bool>();
  }
  return out;
}

std::optional<LogRequest> ParseLogRequest(const nlohmann::json& payload, std::string* err) {
  if (!payload.is_object()) {
    Fail(err, "Request must be an object");
    return std::nullopt;
  }
  if (!payload.contains("level") || !payload["level"].is_string()) {
    Fail(err, "Missing required field: level");
    return std::nullopt;
  }
  auto level = ParseLogLevel(payload["level"].get<std::string>());
  if (!level) {
    Fail(err, "Field 'level' must be one of: silly, debug, info, warn, error");
    return std::nullopt;
  }
  if (!payload.contains("message") || !payload["message"].is_string()) {
    Fail(err, "Missing required field: message");
    return std::nullopt;
  }
  LogRequest out;
  out.level = *level;
  out.message = payload["message"].get<std::string>();
  if (out.message.empty()) {
    Fail(err, "Field 'message' cannot be empty");
    return std::nullopt;
  }
  if (payload.contains("context") && !payload["context"].is_null()) {
    const auto& ctx = payload["context"];
    if (!ctx.is_object()) {
      Fail(err, "Field 'context' must be an object");
      return std::nullopt;
    }
    for (auto it = ctx.begin(); it != ctx.end(); ++it) {
      if (!IsPrimitive(it.value())) {
        Fail(err, "Field 'context." + it.key() + "' must be a primitive value");
        return std::nullopt;
      }
    }
    out.context = ctx;
  }
  return out;
}

}  // namespace bridge
