#include "sockd/compositelogger.hpp"

namespace sockd {

CompositeLogger& CompositeLogger::instance() {
  static CompositeLogger instance;
  return instance;
}

void CompositeLogger::addLogger(const std::shared_ptr<ILogger>& logger) {
  if (!logger) return;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& existing : loggers_) {
    if (existing.get() == logger.get()) return;
  }
  loggers_.push_back(logger);
}

void CompositeLogger::clearLoggers() {
  std::lock_guard<std::mutex> lock(mutex_);
  loggers_.clear();
}

bool CompositeLogger::empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return loggers_.empty();
}

void CompositeLogger::init(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& logger : loggers_) {
    logger->init(level);
  }
}

void CompositeLogger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  currentLevel_.store(level, std::memory_order_release);
  for (auto& logger : loggers_) {
    logger->setLogLevel(level);
  }
}

void CompositeLogger::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& logger : loggers_) {
    logger->flush();
  }
}

void CompositeLogger::log(LogLevel level, const std::string& message) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& logger : loggers_) {
    switch (level) {
      case LogLevel::LOG_DEBUG:
        logger->debug(message);
        break;
      case LogLevel::LOG_INFO:
        logger->info(message);
        break;
      case LogLevel::LOG_WARNING:
        logger->warning(message);
        break;
      case LogLevel::LOG_ERROR:
        logger->error(message);
        break;
      case LogLevel::LOG_CRITICAL:
        logger->critical(message);
        break;
    }
  }
}

bool CompositeLogger::shouldSkipLog(LogLevel) const {
  // Фильтрация делегируется вложенным логгерам
  return false;
}

}  // namespace sockd
