#include "sockd/consolelogger.hpp"

#include <unistd.h>

#include <iostream>
#include <sstream>

sockd::ConsoleLogger& sockd::ConsoleLogger::instance() {
  static sockd::ConsoleLogger instance;
  return instance;
}

void sockd::ConsoleLogger::init(LogLevel level) { setLogLevel(level); }

void sockd::ConsoleLogger::setLogLevel(LogLevel level) {
  currentLevel_.store(level, std::memory_order_release);
}

void sockd::ConsoleLogger::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cout.flush();
}

void sockd::ConsoleLogger::log(LogLevel level, const std::string& message) {
  if (shouldSkipLog(level)) return;

  std::ostringstream formatted;
  formatted << TimeFormatter::format(std::chrono::system_clock::now()) << " ["
            << leveltoString(level) << "] " << message;

  std::lock_guard<std::mutex> lock(mutex_);
  // stdout может быть перенаправлен в файл после демонизации
  if (isatty(STDOUT_FILENO)) {
    std::cout << colorCode(level) << formatted.str() << SOCKD_ANSI_COLOR_RESET
              << std::endl;
  } else {
    std::cout << formatted.str() << std::endl;
  }
}

const char* sockd::ConsoleLogger::colorCode(LogLevel level) {
  switch (level) {
    case LogLevel::LOG_DEBUG:
      return "\033[36m";  // Cyan
    case LogLevel::LOG_INFO:
      return "\033[32m";  // Green
    case LogLevel::LOG_WARNING:
      return "\033[33m";  // Yellow
    case LogLevel::LOG_ERROR:
      return "\033[31m";  // Red
    case LogLevel::LOG_CRITICAL:
      return "\033[41m\033[37m";  // White on Red
  }
  return SOCKD_ANSI_COLOR_RESET;
}
