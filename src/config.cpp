#include "config.hpp"

#include "workspace_path.hpp"

#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

namespace bridge {
namespace {

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static std::string Trim(std::string v) {
  while (!v.empty() && (v.front() == ' ' || v.front() == '\t')) v.erase(v.begin());
  while (!v.empty() && (v.back() == ' ' || v.back() == '\t')) v.pop_back();
  return v;
}

static std::vector<std::string> SplitCsv(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      cur = Trim(cur);
      if (!cur.empty()) out.push_back(cur);
      cur.clear();
      continue;
    }
    cur.push_back(c);
  }
  cur = Trim(cur);
  if (!cur.empty()) out.push_back(cur);
  return out;
}

static std::string ToLower(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static bool TryParseBool(const std::string& s, bool* out) {
  if (!out) return false;
  const std::string v = ToLower(s);
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

static bool TryParseInt(const std::string& s, int min_value, int max_value, int* out) {
  if (!out || s.empty()) return false;
  char* end = nullptr;
  const long v = std::strtol(s.c_str(), &end, 10);
  if (!end || *end != '\0') return false;
  if (v < min_value || v > max_value) return false;
  *out = static_cast<int>(v);
  return true;
}

}  // namespace

std::vector<WorkspaceIdentity> ParseWorkspaceSeeds(const std::string& csv) {
  std::vector<WorkspaceIdentity> out;
  for (const auto& entry : SplitCsv(csv)) {
    const auto eq = entry.find('=');
    if (eq == std::string::npos) continue;
    const auto ref = Trim(entry.substr(0, eq));
    const auto path = Trim(entry.substr(eq + 1));
    const auto slash = ref.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 >= ref.size()) continue;
    if (!IsAbsoluteWorkspacePath(path)) continue;

    WorkspaceIdentity id;
    id.project_id = ref.substr(0, slash);
    id.workspace_name = ref.substr(slash + 1);
    id.workspace_path = NormalizeWorkspacePath(path);
    out.push_back(std::move(id));
  }
  return out;
}

BridgeConfig LoadConfigFromEnv() {
  BridgeConfig cfg;

  int v = 0;
  if (auto port = GetEnvStr("BRIDGE_MCP_PORT"); TryParseInt(port, 0, 65535, &v)) cfg.mcp_port = v;
  if (auto port = GetEnvStr("BRIDGE_PLUGIN_PORT"); TryParseInt(port, 0, 65535, &v)) cfg.plugin_port = v;
  if (auto enabled = GetEnvStr("BRIDGE_PLUGIN_ENABLED"); !enabled.empty()) {
    bool b = true;
    if (TryParseBool(enabled, &b)) cfg.plugin_enabled = b;
  }
  if (auto level = GetEnvStr("BRIDGE_LOG_LEVEL"); !level.empty()) {
    if (auto parsed = ParseLogLevel(level)) cfg.log_level = *parsed;
  }
  if (auto dev = GetEnvStr("BRIDGE_DEVELOPMENT"); !dev.empty()) {
    bool b = false;
    if (TryParseBool(dev, &b)) cfg.development = b;
  }
  if (auto t = GetEnvStr("BRIDGE_COMMAND_TIMEOUT_MS"); TryParseInt(t, 1, 3600 * 1000, &v)) cfg.command_timeout_ms = v;
  if (auto w = GetEnvStr("BRIDGE_SOCKET_WORKERS"); TryParseInt(w, 1, 64, &v)) cfg.socket_workers = v;
  if (auto t = GetEnvStr("BRIDGE_AGENT_QUERY_TIMEOUT_S"); TryParseInt(t, 1, 600, &v)) cfg.agent_query_timeout_seconds = v;
  if (auto seeds = GetEnvStr("BRIDGE_WORKSPACES"); !seeds.empty()) cfg.workspaces = ParseWorkspaceSeeds(seeds);

  return cfg;
}

}  // namespace bridge
