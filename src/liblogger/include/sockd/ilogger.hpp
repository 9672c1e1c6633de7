/**
 * @file ilogger.hpp
 * @brief Базовый интерфейс логгеров sockd и вспомогательные компоненты.
 *
 * @details Уровни логирования, форматирование времени и общий контракт
 * ILogger, через который пишут все модули (контроллер, транспорт,
 * супервизор процессов).
 */

#pragma once

#include <atomic>
#include <chrono>
#include <string>

namespace sockd {

enum class LogLevel {
  LOG_DEBUG,
  LOG_INFO,
  LOG_WARNING,
  LOG_ERROR,
  LOG_CRITICAL
};

/**
 * @class TimeFormatter
 * @brief Форматирование временных меток по единому strftime-шаблону
 */
class TimeFormatter {
 public:
  /**
   * @brief Установить глобальный шаблон
   * @return false если шаблон пустой, текущий шаблон не меняется
   */
  static bool setGlobalFormat(const std::string& fmt);

  static std::string getGlobalFormat();

  static std::string format(const std::chrono::system_clock::time_point& tp);

 private:
  inline static std::string globalFormat_ = "%Y-%m-%d %T";
};

class ILogger {
 public:
  virtual void init(LogLevel level) = 0;

  virtual void setLogLevel(LogLevel level) = 0;
  virtual LogLevel getLogLevel() const;

  virtual void debug(const std::string& message);
  virtual void info(const std::string& message);
  virtual void warning(const std::string& message);
  virtual void error(const std::string& message);
  virtual void critical(const std::string& message);

  virtual void flush() = 0;

  virtual ~ILogger() = default;

 protected:
  std::atomic<LogLevel> currentLevel_ = LogLevel::LOG_INFO;
  virtual void log(LogLevel, const std::string&) = 0;
  virtual bool shouldSkipLog(LogLevel level) const;
};

std::string leveltoString(LogLevel level);

/**
 * @brief Разбор уровня из конфигурации ("debug", "info", "warning",
 * "error", "critical"), регистр не учитывается
 * @throw std::invalid_argument при неизвестном имени уровня
 */
LogLevel stringToLogLevel(const std::string& level);

}  // namespace sockd
