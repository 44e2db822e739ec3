#pragma once

#include "logging.hpp"
#include "workspace_api.hpp"

#include <optional>
#include <string>

namespace bridge {

// Looks up the model used by the most recent user message of the agent
// server listening on `port`.
class IAgentModelQuery {
 public:
  virtual ~IAgentModelQuery() = default;
  // nullopt with empty `err` means the agent has no such message;
  // nullopt with `err` set means the query itself failed.
  virtual std::optional<PromptModel> LatestUserModel(int port, std::string* err) = 0;
};

// Talks to an opencode server on 127.0.0.1:<port>:
// GET /session (first entry is the active session), then
// GET /session/<id>/message.
class OpencodeModelQuery : public IAgentModelQuery {
 public:
  explicit OpencodeModelQuery(int timeout_seconds = 5, Logger* logger = nullptr);

  std::optional<PromptModel> LatestUserModel(int port, std::string* err) override;

 private:
  int timeout_seconds_;
  Logger* logger_;
};

// Picks the model of the last user message from a /session/<id>/message body.
std::optional<PromptModel> ExtractLatestUserModel(const nlohmann::json& messages);

}  // namespace bridge
