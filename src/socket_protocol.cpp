#include "socket_protocol.hpp"

namespace bridge {

nlohmann::json ToJson(const PluginConfig& config) {
  return {{"isDevelopment", config.is_development}};
}

std::string EncodeFrame(const nlohmann::json& frame) {
  return frame.dump() + "\n";
}

void FrameReader::Append(const char* data, size_t size) {
  buffer_.append(data, size);
}

std::optional<std::string> FrameReader::Next() {
  while (true) {
    const auto pos = buffer_.find('\n', scan_from_);
    if (pos == std::string::npos) {
      scan_from_ = buffer_.size();
      if (buffer_.size() > max_frame_bytes_) overflowed_ = true;
      return std::nullopt;
    }
    std::string line = buffer_.substr(0, pos);
    buffer_.erase(0, pos + 1);
    scan_from_ = 0;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.size() > max_frame_bytes_) {
      overflowed_ = true;
      return std::nullopt;
    }
    if (line.empty()) continue;
    return line;
  }
}

}  // namespace bridge
