#include "logging.hpp"

#include <iostream>
#include <sstream>
#include <utility>

namespace bridge {
namespace {

static std::string ToLower(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static std::string TruncateForLog(const std::string& s, size_t max_len) {
  if (s.size() <= max_len) return s;
  return s.substr(0, max_len) + "...";
}

static std::string FormatValue(const nlohmann::json& v) {
  if (v.is_string()) return TruncateForLog(v.get<std::string>(), 200);
  return TruncateForLog(v.dump(), 200);
}

}  // namespace

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kSilly:
      return "silly";
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

std::optional<LogLevel> ParseLogLevel(const std::string& text) {
  const std::string v = ToLower(text);
  if (v == "silly") return LogLevel::kSilly;
  if (v == "debug") return LogLevel::kDebug;
  if (v == "info") return LogLevel::kInfo;
  if (v == "warn") return LogLevel::kWarn;
  if (v == "error") return LogLevel::kError;
  return std::nullopt;
}

void LogAtLevel(Logger* logger, LogLevel level, const std::string& message, const LogContext& context) {
  if (!logger) return;
  logger->Log(level, message, context);
}

ConsoleLogger::ConsoleLogger(std::string scope, LogLevel min_level)
    : scope_(std::move(scope)), min_level_(min_level) {}

void ConsoleLogger::Log(LogLevel level, const std::string& message, const LogContext& context) {
  if (static_cast<int>(level) < static_cast<int>(min_level_)) return;

  std::ostringstream line;
  line << "[" << scope_ << "] " << LogLevelName(level) << " " << message;
  if (context.is_object()) {
    for (auto it = context.begin(); it != context.end(); ++it) {
      line << " " << it.key() << "=" << FormatValue(it.value());
    }
  }
  line << "\n";

  std::lock_guard<std::mutex> lock(mu_);
  std::cout << line.str();
}

Logger* DefaultSilentLogger() {
  static SilentLogger logger;
  return &logger;
}

}  // namespace bridge
