#pragma once

#include "sockd/ilogger.hpp"

#include <mutex>

#define SOCKD_ANSI_COLOR_RESET "\033[0m"

namespace sockd {

/**
 * @class ConsoleLogger
 * @brief Логгер в стандартный вывод
 *
 * @details После демонизации stdout процесса перенаправлен в лог-файл,
 * поэтому тот же логгер пишет и в терминал (foreground), и в файл (daemon).
 * Цвет уровня выводится только если stdout является терминалом.
 */
class ConsoleLogger : public ILogger {
 public:
  static ConsoleLogger& instance();

  void init(LogLevel level) override;
  void setLogLevel(LogLevel level) override;
  void flush() override;

 protected:
  ConsoleLogger() = default;
  ~ConsoleLogger() override = default;
  void log(LogLevel level, const std::string& message) override;

 private:
  static const char* colorCode(LogLevel level);

  mutable std::mutex mutex_;
};

}  // namespace sockd
