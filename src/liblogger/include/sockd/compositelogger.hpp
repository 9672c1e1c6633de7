#pragma once

#include "sockd/ilogger.hpp"

#include <memory>
#include <mutex>
#include <vector>

namespace sockd {

/**
 * @class CompositeLogger
 * @brief Точка входа для логирования всех модулей sockd
 *
 * @details Рассылает сообщения всем зарегистрированным логгерам, фильтрация
 * по уровню выполняется вложенными логгерами.
 */
class CompositeLogger : public ILogger {
 public:
  static CompositeLogger& instance();

  CompositeLogger(const CompositeLogger&) = delete;
  CompositeLogger& operator=(const CompositeLogger&) = delete;

  void addLogger(const std::shared_ptr<ILogger>& logger);
  void clearLoggers();
  bool empty() const;

  void init(LogLevel level) override;
  void setLogLevel(LogLevel level) override;
  void flush() override;

 protected:
  bool shouldSkipLog(LogLevel level) const override;
  void log(LogLevel level, const std::string& message) override;

 private:
  CompositeLogger() = default;
  ~CompositeLogger() override = default;

  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<ILogger>> loggers_;
};

/**
 * @brief Обертка синглтона в shared_ptr без владения
 */
template <typename Logger>
std::shared_ptr<ILogger> unownedLogger(Logger& logger) {
  return std::shared_ptr<ILogger>(&logger, [](ILogger*) {});
}

}  // namespace sockd
