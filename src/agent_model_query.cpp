#include "agent_model_query.hpp"

#include <httplib.h>

#include <memory>
#include <string>

namespace bridge {
namespace {

static std::unique_ptr<httplib::Client> MakeClient(int port, int timeout_seconds) {
  auto cli = std::make_unique<httplib::Client>("127.0.0.1", port);
  cli->set_connection_timeout(timeout_seconds);
  cli->set_read_timeout(timeout_seconds);
  cli->set_write_timeout(timeout_seconds);
  return cli;
}

static std::optional<nlohmann::json> GetJson(httplib::Client* cli, const std::string& path, std::string* err) {
  auto res = cli->Get(path.c_str());
  if (!res) {
    if (err) *err = "agent: failed to connect (" + httplib::to_string(res.error()) + ")";
    return std::nullopt;
  }
  if (res->status < 200 || res->status >= 300) {
    if (err) *err = "agent: http " + std::to_string(res->status) + " for " + path;
    return std::nullopt;
  }
  auto j = nlohmann::json::parse(res->body, nullptr, false);
  if (j.is_discarded()) {
    if (err) *err = "agent: invalid json response for " + path;
    return std::nullopt;
  }
  return j;
}

}  // namespace

std::optional<PromptModel> ExtractLatestUserModel(const nlohmann::json& messages) {
  if (!messages.is_array()) return std::nullopt;
  for (auto it = messages.rbegin(); it != messages.rend(); ++it) {
    const auto& m = *it;
    if (!m.is_object() || !m.contains("info") || !m["info"].is_object()) continue;
    const auto& info = m["info"];
    if (!info.contains("role") || info["role"] != "user") continue;
    // Only the last user message counts, even when it carries no model.
    if (!info.contains("model") || !info["model"].is_object()) return std::nullopt;
    const auto& model = info["model"];
    if (!model.contains("providerID") || !model["providerID"].is_string()) return std::nullopt;
    if (!model.contains("modelID") || !model["modelID"].is_string()) return std::nullopt;
    return PromptModel{model["providerID"].get<std::string>(), model["modelID"].get<std::string>()};
  }
  return std::nullopt;
}

OpencodeModelQuery::OpencodeModelQuery(int timeout_seconds, Logger* logger)
    : timeout_seconds_(timeout_seconds > 0 ? timeout_seconds : 5),
      logger_(logger ? logger : DefaultSilentLogger()) {}

std::optional<PromptModel> OpencodeModelQuery::LatestUserModel(int port, std::string* err) {
  auto cli = MakeClient(port, timeout_seconds_);

  auto sessions = GetJson(cli.get(), "/session", err);
  if (!sessions) return std::nullopt;
  if (!sessions->is_array() || sessions->empty() || !(*sessions)[0].is_object() || !(*sessions)[0].contains("id") ||
      !(*sessions)[0]["id"].is_string()) {
    logger_->Debug("No active session on agent server", {{"port", port}});
    return std::nullopt;
  }
  const auto session_id = (*sessions)[0]["id"].get<std::string>();

  auto messages = GetJson(cli.get(), "/session/" + session_id + "/message", err);
  if (!messages) return std::nullopt;
  auto model = ExtractLatestUserModel(*messages);
  if (!model) {
    logger_->Debug("No user message with model in agent session", {{"port", port}, {"sessionId", session_id}});
  }
  return model;
}

}  // namespace bridge
