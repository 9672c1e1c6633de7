/**
 * @file ServiceError.hpp
 * @brief Исключение уровня сервиса с классификацией ошибки
 *
 * @details Все отказы жизненного цикла (start/stop/send), транспорта и
 * прав доступа поднимаются как ServiceError с конкретным ErrorKind.
 * Системные ошибки без доменного смысла остаются std::system_error.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace sockd {

enum class ErrorKind {
  AlreadyRunning,
  StartTimeout,
  StopFailed,
  NotRunning,
  ConnectionError,
  SocketInUse,
  TransportPermissionError,
  PathPermissionError,
  PrivilegeError,
  BadCommand
};

/**
 * @brief Имя вида ошибки для логов ("AlreadyRunning", ...)
 */
const char* errorKindName(ErrorKind kind) noexcept;

class ServiceError : public std::runtime_error {
 public:
  ServiceError(ErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

 private:
  ErrorKind kind_;
};

}  // namespace sockd
