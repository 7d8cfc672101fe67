#pragma once

#include <functional>
#include <string>

#include <nlohmann/json.hpp>

namespace aigw {

enum class LogLevel { Off = 0, Error = 1, Warn = 2, Info = 3, Debug = 4 };

using LoggerCallback = std::function<void(LogLevel level, const std::string& message, const nlohmann::json& details)>;

LogLevel parse_log_level(const std::string& value, LogLevel fallback = LogLevel::Off);

/**
 * Level filter in front of a LoggerCallback. A default constructed Logger
 * drops every message.
 */
class Logger {
public:
  Logger() = default;
  Logger(LogLevel level, LoggerCallback callback)
      : level_(level), callback_(std::move(callback)) {}

  bool enabled(LogLevel level) const;
  void log(LogLevel level, const std::string& message, const nlohmann::json& details = nlohmann::json::object()) const;

  LogLevel level() const { return level_; }

private:
  LogLevel level_ = LogLevel::Off;
  LoggerCallback callback_;
};

}  // namespace aigw
