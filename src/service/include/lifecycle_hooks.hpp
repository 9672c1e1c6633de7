/**
 * @file lifecycle_hooks.hpp
 * @brief Пользовательские обработчики жизненного цикла сервиса
 */
#pragma once

#include <functional>
#include <optional>
#include <string>

#include "sockd/Connection.hpp"

namespace sockd {

class ServiceController;

/**
 * @struct LifecycleHooks
 * @brief Набор необязательных обработчиков
 *
 * @details
 *  - onSetup: после сброса привилегий, до открытия сокета
 *  - onTeardown: по сигналу INT/QUIT/TERM перед завершением с кодом 130
 *  - onHandle: один запрос; аргументы - просмотренные (не извлеченные из
 *    сокета) байты запроса и само соединение. Возвращенная строка
 *    отправляется клиентом как один кадр; std::nullopt означает, что
 *    обработчик ответил сам.
 *
 * @code
 LifecycleHooks hooks;
 hooks.onHandle = [](const std::string& raw, Connection&) {
     return std::optional<std::string>(protocol::trimFrame(raw));
 };
 @endcode
 */
struct LifecycleHooks {
  using SetupHook = std::function<void(ServiceController &)>;
  using TeardownHook = std::function<void(ServiceController &)>;
  using HandleHook = std::function<std::optional<std::string>(
      const std::string &message, Connection &connection)>;

  SetupHook onSetup;
  TeardownHook onTeardown;
  HandleHook onHandle;
};

}  // namespace sockd
