#pragma once

#include "logging.hpp"
#include "workspace_registry.hpp"

#include <string>
#include <vector>

namespace bridge {

struct BridgeConfig {
  // 0 picks a free loopback port.
  int mcp_port = 0;
  int plugin_port = 0;
  bool plugin_enabled = true;
  LogLevel log_level = LogLevel::kInfo;
  bool development = false;
  int command_timeout_ms = 10000;
  int socket_workers = 4;
  int agent_query_timeout_seconds = 5;
  std::vector<WorkspaceIdentity> workspaces;
};

BridgeConfig LoadConfigFromEnv();

// "projectId/workspaceName=/abs/path" entries separated by commas.
// Malformed entries are skipped.
std::vector<WorkspaceIdentity> ParseWorkspaceSeeds(const std::string& csv);

}  // namespace bridge
