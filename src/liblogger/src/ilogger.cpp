#include "sockd/ilogger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace sockd {

bool TimeFormatter::setGlobalFormat(const std::string& fmt) {
  if (fmt.empty()) {
    return false;
  }
  globalFormat_ = fmt;
  return true;
}

std::string TimeFormatter::getGlobalFormat() { return globalFormat_; }

std::string TimeFormatter::format(
    const std::chrono::system_clock::time_point& tp) {
  auto now_time = std::chrono::system_clock::to_time_t(tp);
  std::tm now_tm{};
  if (localtime_r(&now_time, &now_tm) == nullptr) {
    return "[INVALID_TIME]";
  }

  std::ostringstream oss;
  oss << std::put_time(&now_tm, globalFormat_.c_str());
  return oss.str();
}

LogLevel ILogger::getLogLevel() const {
  return currentLevel_.load(std::memory_order_acquire);
}

void ILogger::debug(const std::string& message) {
  log(LogLevel::LOG_DEBUG, message);
}

void ILogger::info(const std::string& message) {
  log(LogLevel::LOG_INFO, message);
}

void ILogger::warning(const std::string& message) {
  log(LogLevel::LOG_WARNING, message);
}

void ILogger::error(const std::string& message) {
  log(LogLevel::LOG_ERROR, message);
}

void ILogger::critical(const std::string& message) {
  log(LogLevel::LOG_CRITICAL, message);
}

bool ILogger::shouldSkipLog(LogLevel level) const {
  return static_cast<int>(level) <
         static_cast<int>(currentLevel_.load(std::memory_order_acquire));
}

std::string leveltoString(LogLevel level) {
  switch (level) {
    case LogLevel::LOG_DEBUG:
      return "DEBUG";
    case LogLevel::LOG_INFO:
      return "INFO";
    case LogLevel::LOG_WARNING:
      return "WARNING";
    case LogLevel::LOG_ERROR:
      return "ERROR";
    case LogLevel::LOG_CRITICAL:
      return "CRITICAL";
  }
  return "";
}

LogLevel stringToLogLevel(const std::string& level) {
  std::string lowered(level);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lowered == "debug") return LogLevel::LOG_DEBUG;
  if (lowered == "info") return LogLevel::LOG_INFO;
  if (lowered == "warning" || lowered == "warn") return LogLevel::LOG_WARNING;
  if (lowered == "error") return LogLevel::LOG_ERROR;
  if (lowered == "critical") return LogLevel::LOG_CRITICAL;

  throw std::invalid_argument("Unknown log level: " + level);
}

}  // namespace sockd
