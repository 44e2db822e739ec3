#pragma once

#include "tool_result.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace bridge {

// Per-request values supplied by the transport, kept apart from tool arguments.
struct RequestContext {
  std::string workspace_path;
};

struct ToolSchema {
  std::string name;
  std::string description;
  nlohmann::json input_schema;
};

using ToolHandler = std::function<ToolResult(const RequestContext& ctx, const nlohmann::json& arguments)>;

class ToolRegistry {
 public:
  ToolRegistry() = default;
  ToolRegistry(const ToolRegistry&) = delete;
  ToolRegistry& operator=(const ToolRegistry&) = delete;

  // Re-registering a name replaces the handler and keeps its list position.
  void RegisterTool(ToolSchema schema, ToolHandler handler);
  bool HasTool(const std::string& name) const;
  std::optional<ToolSchema> GetSchema(const std::string& name) const;
  std::optional<ToolHandler> GetHandler(const std::string& name) const;

  // Schemas in registration order.
  std::vector<ToolSchema> ListSchemas() const;
  size_t Size() const;
  void Clear();

 private:
  mutable std::shared_mutex mu_;
  std::vector<std::string> order_;
  std::unordered_map<std::string, ToolSchema> schemas_;
  std::unordered_map<std::string, ToolHandler> handlers_;
};

nlohmann::json ToolSchemaToJson(const ToolSchema& schema);

}  // namespace bridge
