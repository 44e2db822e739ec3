#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace bridge {

// Newline-delimited JSON frames exchanged with editor clients.
namespace socket_protocol {

constexpr size_t kMaxFrameBytes = 1024 * 1024;
constexpr int kCommandTimeoutMs = 10000;
constexpr int kShutdownTimeoutMs = 5000;
constexpr int kDefaultWorkerThreads = 4;
constexpr int kMaxWorkerThreads = 64;

constexpr const char* kFrameHello = "hello";
constexpr const char* kFrameCall = "call";
constexpr const char* kFrameResult = "result";
constexpr const char* kFrameEmit = "emit";
constexpr const char* kFrameAck = "ack";
constexpr const char* kFrameConfig = "config";
constexpr const char* kFrameCommand = "command";
constexpr const char* kFrameShutdown = "shutdown";

constexpr const char* kEventGetStatus = "api:workspace:getStatus";
constexpr const char* kEventGetMetadata = "api:workspace:getMetadata";
constexpr const char* kEventSetMetadata = "api:workspace:setMetadata";
constexpr const char* kEventGetAgentSession = "api:workspace:getAgentSession";
constexpr const char* kEventDelete = "api:workspace:delete";
constexpr const char* kEventExecuteCommand = "api:workspace:executeCommand";
constexpr const char* kEventCreate = "api:workspace:create";
constexpr const char* kEventLog = "api:log";

}  // namespace socket_protocol

struct PluginConfig {
  bool is_development = false;
};

nlohmann::json ToJson(const PluginConfig& config);

std::string EncodeFrame(const nlohmann::json& frame);

// Splits a byte stream into lines. A pending line longer than the limit
// marks the reader as overflowed; the connection should then be dropped.
class FrameReader {
 public:
  explicit FrameReader(size_t max_frame_bytes = socket_protocol::kMaxFrameBytes) : max_frame_bytes_(max_frame_bytes) {}

  void Append(const char* data, size_t size);
  // Next complete line without its terminator; empty lines are skipped.
  std::optional<std::string> Next();
  bool Overflowed() const { return overflowed_; }

 private:
  size_t max_frame_bytes_;
  std::string buffer_;
  size_t scan_from_ = 0;
  bool overflowed_ = false;
};

}  // namespace bridge
