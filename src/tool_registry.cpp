#include "tool_registry.hpp"

#include <mutex>
#include <utility>

namespace bridge {

void ToolRegistry::RegisterTool(ToolSchema schema, ToolHandler handler) {
  std::unique_lock<std::shared_mutex> lock(mu_);
  const auto name = schema.name;
  if (schemas_.find(name) == schemas_.end()) order_.push_back(name);
  schemas_[name] = std::move(schema);
  handlers_[name] = std::move(handler);
}

bool ToolRegistry::HasTool(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return schemas_.find(name) != schemas_.end() && handlers_.find(name) != handlers_.end();
}

std::optional<ToolSchema> ToolRegistry::GetSchema(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = schemas_.find(name);
  if (it == schemas_.end()) return std::nullopt;
  return it->second;
}

std::optional<ToolHandler> ToolRegistry::GetHandler(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = handlers_.find(name);
  if (it == handlers_.end()) return std::nullopt;
  return it->second;
}

std::vector<ToolSchema> ToolRegistry::ListSchemas() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  std::vector<ToolSchema> out;
  out.reserve(order_.size());
  for (const auto& name : order_) {
    auto it = schemas_.find(name);
    if (it != schemas_.end()) out.push_back(it->second);
  }
  return out;
}

size_t ToolRegistry::Size() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return order_.size();
}

void ToolRegistry::Clear() {
  std::unique_lock<std::shared_mutex> lock(mu_);
  order_.clear();
  schemas_.clear();
  handlers_.clear();
}

nlohmann::json ToolSchemaToJson(const ToolSchema& schema) {
  nlohmann::json out;
  out["name"] = schema.name;
  out["description"] = schema.description;
  out["inputSchema"] = schema.input_schema.is_object() ? schema.input_schema
                                                        : nlohmann::json{{"type", "object"}, {"properties", nlohmann::json::object()}};
  return out;
}

}  // namespace bridge
