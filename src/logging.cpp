#include "aigw/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace aigw {

LogLevel parse_log_level(const std::string& value, LogLevel fallback) {
  std::string lowered; lowered.reserve(value.size());
  std::transform(value.begin(), value.end(), std::back_inserter(lowered), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "off" || lowered == "none") return LogLevel::Off;
  if (lowered == "error") return LogLevel::Error;
  if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
  if (lowered == "info") return LogLevel::Info;
  if (lowered == "debug" || lowered == "trace") return LogLevel::Debug;
  return fallback;
}

bool Logger::enabled(LogLevel level) const {
  if (!callback_ || level == LogLevel::Off) {
    return false;
  }
  return static_cast<int>(level) <= static_cast<int>(level_);
}

void Logger::log(LogLevel level, const std::string& message, const nlohmann::json& details) const {
  if (!enabled(level)) {
    return;
  }
  callback_(level, message, details);
}

}  // namespace aigw
