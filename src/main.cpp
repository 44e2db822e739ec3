#include "agent_model_query.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "port_allocator.hpp"
#include "protocol_lifecycle_manager.hpp"
#include "socket_protocol_server.hpp"
#include "standalone_workspace_api.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_stop_requested{false};

void HandleSignal(int) {
  g_stop_requested.store(true);
}

std::unique_ptr<bridge::PortAllocator> MakePortAllocator(int port) {
  if (port > 0) return std::make_unique<bridge::FixedPortAllocator>(port);
  return std::make_unique<bridge::LoopbackPortAllocator>();
}

}  // namespace

int main() {
  std::cout.setf(std::ios::unitbuf);
  auto cfg = bridge::LoadConfigFromEnv();

  bridge::ConsoleLogger bridge_log("bridge", cfg.log_level);
  bridge::ConsoleLogger mcp_log("mcp", cfg.log_level);
  bridge::ConsoleLogger plugin_log("plugin", cfg.log_level);
  bridge::ConsoleLogger extension_log("extension", cfg.log_level);
  bridge::ConsoleLogger api_log("api", cfg.log_level);

  bridge_log.Info("Configuration", {{"mcpPort", cfg.mcp_port},
                                    {"pluginPort", cfg.plugin_port},
                                    {"pluginEnabled", cfg.plugin_enabled},
                                    {"development", cfg.development},
                                    {"logLevel", bridge::LogLevelName(cfg.log_level)},
                                    {"workspaces", static_cast<int>(cfg.workspaces.size())}});

  bridge::StandaloneWorkspaceApi api(&api_log);
  bridge::OpencodeModelQuery model_query(cfg.agent_query_timeout_seconds, &mcp_log);

  auto mcp_ports = MakePortAllocator(cfg.mcp_port);
  bridge::ProtocolLifecycleManager manager(*mcp_ports, api, &mcp_log, &model_query);

  auto plugin_ports = MakePortAllocator(cfg.plugin_port);
  bridge::SocketFrontOptions plugin_options;
  plugin_options.config.is_development = cfg.development;
  plugin_options.command_timeout_ms = cfg.command_timeout_ms;
  plugin_options.worker_threads = cfg.socket_workers;
  bridge::SocketProtocolFront plugin(*plugin_ports, api, manager, &plugin_log, &extension_log, plugin_options);

  api.SetCommandForwarder([&plugin](const std::string& path, const std::string& command, const nlohmann::json& args) {
    return plugin.SendCommand(path, command, args);
  });

  auto unsubscribe_created = api.On("workspace:created", [&manager](const nlohmann::json& payload) {
    const auto& ws = payload.at("workspace");
    manager.RegisterWorkspace({ws.at("projectId").get<std::string>(), ws.at("name").get<std::string>(),
                               ws.at("path").get<std::string>()});
  });
  auto unsubscribe_removed = api.On("workspace:removed", [&manager, &plugin](const nlohmann::json& payload) {
    const auto path = payload.at("path").get<std::string>();
    plugin.SendExtensionHostShutdown(path);
    manager.UnregisterWorkspace(path);
  });
  auto unsubscribe_first = manager.OnFirstRequest([&bridge_log](const std::string& path) {
    bridge_log.Info("Agent attached", {{"workspace", path}});
  });

  for (const auto& identity : cfg.workspaces) {
    api.Seed(identity);
    manager.RegisterWorkspace(identity);
  }

  std::string err;
  auto mcp_port = manager.Start(&err);
  if (!mcp_port) {
    bridge_log.Error("Failed to start tool front", {{"error", err}});
    api.Dispose();
    return 1;
  }

  if (cfg.plugin_enabled) {
    auto plugin_port = plugin.Start(&err);
    if (!plugin_port) {
      bridge_log.Error("Failed to start socket front", {{"error", err}});
      manager.Stop();
      api.Dispose();
      return 1;
    }
    bridge_log.Info("Socket front listening", {{"port", *plugin_port}});
  }
  bridge_log.Info("Tool front listening", {{"port", *mcp_port}, {"endpoint", "http://127.0.0.1:" + std::to_string(*mcp_port) + "/mcp"}});

  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);
  while (!g_stop_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  bridge_log.Info("Shutting down");
  unsubscribe_first();
  unsubscribe_created();
  unsubscribe_removed();
  plugin.Close();
  manager.Stop();
  api.Dispose();
  return 0;
}
