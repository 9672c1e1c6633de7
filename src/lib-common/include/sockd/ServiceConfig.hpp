/**
 * @file ServiceConfig.hpp
 * @brief Параметры экземпляра сервиса и его производная идентичность
 */

#pragma once

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace sockd {

/**
 * @struct ServiceConfig
 * @brief Настройки транспорта, демонизации и остановки
 *
 * @details socketPath и пара (host, port) взаимоисключающие: сокет Unix
 * выбирается наличием socketPath. Используйте useUnixSocket()/useTcp(),
 * чтобы не нарушить инвариант.
 */
struct ServiceConfig {
  std::string host = "127.0.0.1";
  std::uint16_t port = 0;
  std::optional<std::string> socketPath;
  mode_t socketMode = 0660;  ///< 0 - права сокета не меняются
  bool daemonize = true;
  std::optional<std::string> pidPath;  ///< по умолчанию /var/run/<safeName>.pid
  std::optional<std::string> logPath;  ///< по умолчанию /dev/null
  bool force = false;
  std::optional<std::string> user;
  std::optional<std::string> group;

  std::string logLevel = "info";
  std::chrono::milliseconds startTimeout{5000};
  std::chrono::milliseconds stopTimeout{2000};
  std::chrono::milliseconds reclaimTimeout{5000};
  std::chrono::milliseconds sendTimeout{30000};

  void useUnixSocket(const std::string& path);
  void useTcp(const std::string& tcpHost, std::uint16_t tcpPort);
  bool usesUnixSocket() const { return socketPath.has_value(); }

  /// Адрес для сообщений об ошибках: путь сокета или host:port
  std::string endpointName() const;
};

/**
 * @brief Разбор восьмеричной маски прав ("0660", "660", "0o660")
 * @throw std::invalid_argument при недопустимых символах или значении > 07777
 */
mode_t parseSocketMode(const std::string& text);

/**
 * @class ServiceIdentity
 * @brief Отображаемое и безопасное для путей имя сервиса
 */
class ServiceIdentity {
 public:
  explicit ServiceIdentity(std::string name);

  const std::string& name() const { return name_; }
  const std::string& safeName() const { return safeName_; }

  /// /var/run/<safeName>.pid
  std::string defaultPidPath() const;

  /// Удаляет ведущие цифры и все символы, кроме [A-Za-z0-9]
  static std::string sanitize(const std::string& name);

 private:
  std::string name_;
  std::string safeName_;
};

}  // namespace sockd
