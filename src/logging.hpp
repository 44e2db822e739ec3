#pragma once

#include <nlohmann/json.hpp>

#include <mutex>
#include <optional>
#include <string>

namespace bridge {

enum class LogLevel {
  kSilly = 0,
  kDebug = 1,
  kInfo = 2,
  kWarn = 3,
  kError = 4,
};

// Flat JSON object of primitive values.
using LogContext = nlohmann::json;

const char* LogLevelName(LogLevel level);
std::optional<LogLevel> ParseLogLevel(const std::string& text);

class Logger {
 public:
  virtual ~Logger() = default;

  virtual void Log(LogLevel level, const std::string& message, const LogContext& context) = 0;

  void Silly(const std::string& message, const LogContext& context = LogContext::object()) {
    Log(LogLevel::kSilly, message, context);
  }
  void Debug(const std::string& message, const LogContext& context = LogContext::object()) {
    Log(LogLevel::kDebug, message, context);
  }
  void Info(const std::string& message, const LogContext& context = LogContext::object()) {
    Log(LogLevel::kInfo, message, context);
  }
  void Warn(const std::string& message, const LogContext& context = LogContext::object()) {
    Log(LogLevel::kWarn, message, context);
  }
  void Error(const std::string& message, const LogContext& context = LogContext::object()) {
    Log(LogLevel::kError, message, context);
  }
};

void LogAtLevel(Logger* logger, LogLevel level, const std::string& message, const LogContext& context);

// Writes "[scope] level message key=value ..." lines to stdout.
class ConsoleLogger : public Logger {
 public:
  explicit ConsoleLogger(std::string scope, LogLevel min_level = LogLevel::kInfo);

  void Log(LogLevel level, const std::string& message, const LogContext& context) override;

 private:
  std::string scope_;
  LogLevel min_level_;
  std::mutex mu_;
};

class SilentLogger : public Logger {
 public:
  void Log(LogLevel, const std::string&, const LogContext&) override {}
};

// Process-wide sink used when a component is constructed without a logger.
Logger* DefaultSilentLogger();

}  // namespace bridge
