/**
 * @file Connection.hpp
 * @brief RAII-обертки над дескрипторами управляющего канала
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace sockd {

/**
 * @brief Ожидать готовности дескриптора к чтению
 * @return false по истечении timeout
 * @throw std::system_error при ошибке poll()
 */
bool pollReadable(int fd, std::chrono::milliseconds timeout);

/**
 * @class Connection
 * @brief Одно установленное соединение (клиентское или принятое сервером)
 *
 * @details Владеет дескриптором и закрывает его в деструкторе. Запись
 * выполняется с MSG_NOSIGNAL: разрыв со стороны клиента приходит как
 * std::system_error (EPIPE/ECONNRESET), а не как SIGPIPE.
 */
class Connection {
 public:
  Connection() = default;
  explicit Connection(int fd) noexcept : fd_(fd) {}
  ~Connection();

  Connection(Connection&& other) noexcept;
  Connection& operator=(Connection&& other) noexcept;

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  int fd() const noexcept { return fd_; }
  bool isOpen() const noexcept { return fd_ >= 0; }

  bool waitReadable(std::chrono::milliseconds timeout) const;

  /**
   * @brief Просмотреть до size байт, не извлекая их из сокета (MSG_PEEK)
   * @return пустая строка, если клиент уже закрыл соединение
   */
  std::string peek(std::size_t size) const;

  /**
   * @brief Прочитать строку вместе с терминатором
   *
   * @details Чтение идет до '\n' или до закрытия соединения клиентом.
   * @return std::nullopt, если строка не пришла за timeout
   * @throw std::system_error при ошибке recv()
   */
  std::optional<std::string> readLine(std::chrono::milliseconds timeout);

  /**
   * @brief Записать все байты
   * @throw std::system_error (EPIPE, ECONNRESET, ...)
   */
  void write(const std::string& data);

  /// write(protocol::frame(message))
  void writeFrame(const std::string& message);

  /**
   * @brief Отбросить непрочитанные данные без блокировки
   *
   * @details Закрытие сокета с непрочитанными данными отправляет клиенту
   * RST вместо FIN, и клиент может потерять уже записанный ответ.
   */
  void discardPending() noexcept;

  void close() noexcept;

 private:
  int fd_ = -1;
};

/**
 * @class ServerSocket
 * @brief Слушающий сокет (Unix или TCP)
 *
 * @note Файл Unix-сокета не удаляется при закрытии: следующий запуск
 * освобождает его через проверку живости владельца.
 */
class ServerSocket {
 public:
  ServerSocket() = default;
  ServerSocket(int fd, std::string address) noexcept;
  ~ServerSocket();

  ServerSocket(ServerSocket&& other) noexcept;
  ServerSocket& operator=(ServerSocket&& other) noexcept;

  ServerSocket(const ServerSocket&) = delete;
  ServerSocket& operator=(const ServerSocket&) = delete;

  int fd() const noexcept { return fd_; }
  bool isOpen() const noexcept { return fd_ >= 0; }

  /**
   * @brief Принять соединение (блокирующий вызов)
   * @throw std::system_error при ошибке accept(); EINTR повторяется
   */
  Connection accept();

  /// Путь Unix-сокета или "<host>:<port>" фактически занятого адреса
  const std::string& address() const noexcept { return address_; }

  /// Фактический TCP-порт (полезно при port = 0); 0 для Unix-сокета
  std::uint16_t port() const;

  /// Передать дескриптор вызывающему коду без закрытия
  int release() noexcept;

  void close() noexcept;

 private:
  int fd_ = -1;
  std::string address_;
};

}  // namespace sockd
