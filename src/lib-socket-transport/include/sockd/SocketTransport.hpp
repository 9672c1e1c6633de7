/**
 * @file SocketTransport.hpp
 * @brief Открытие серверной и клиентской стороны управляющего канала
 *
 * @details Транспорт выбирается конфигурацией: при заданном socketPath
 * используется Unix-сокет, иначе TCP на (host, port).
 */

#pragma once

#include <chrono>

#include "sockd/Connection.hpp"
#include "sockd/ServiceConfig.hpp"

namespace sockd {

/**
 * @class SocketTransport
 * @brief Фабрика сокетов управляющего канала
 *
 * @note Освобождение занятого пути Unix-сокета:
 * 1. bind() вернул EADDRINUSE
 * 2. probe() с пределом reclaimTimeout
 * 3. Есть ответ - путь занят живым процессом, ServiceError(SocketInUse)
 * 4. Соединение отклонено, пути нет или ответа не было - путь удаляется,
 *    bind() повторяется один раз
 */
class SocketTransport {
 public:
  /**
   * @brief Открыть слушающий сокет
   *
   * @details После bind() Unix-сокета применяются владелец (user/group) и
   * права socketMode, если они не равны 0.
   *
   * @throw ServiceError(SocketInUse) путь или адрес занят живым процессом
   * @throw ServiceError(TransportPermissionError) нет прав на адрес
   * @throw ServiceError(PrivilegeError) user/group не найдены
   * @throw std::system_error прочие ошибки сокета
   */
  static ServerSocket openServer(const ServiceConfig& config);

  /**
   * @brief Подключиться к работающему экземпляру
   *
   * @throw ServiceError(TransportPermissionError) нет прав на адрес
   * @throw std::system_error ошибка соединения (ECONNREFUSED, ENOENT,
   * ETIMEDOUT, ...); классификация остается за вызывающим кодом
   */
  static Connection openClient(const ServiceConfig& config,
                               std::chrono::milliseconds timeout);

  /**
   * @brief Отправить "ping" и дождаться любого ответа
   * @return true, если по адресу отвечает живой процесс
   * @throw ServiceError(TransportPermissionError) нет прав на адрес
   */
  static bool probe(const ServiceConfig& config,
                    std::chrono::milliseconds timeout);
};

}  // namespace sockd
