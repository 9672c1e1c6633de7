/**
 * @file configvalidator.hpp
 * @brief Проверка структуры и типов JSON-конфигурации сервиса
 *
 * @details
 * Документ может быть плоским объектом с параметрами сервиса либо содержать
 * секции `defaults` и `environments`. Проверка выполняется до преобразования
 * в ServiceConfig, поэтому сообщения об ошибках называют ключ JSON.
 *
 * Пример конфигурации:
 * @code
 {
   "defaults": {
     "name": "listd",
     "socket": "/tmp/listd.sock",
     "mode": "0660",
     "pid_path": "/tmp/listd.pid"
   },
   "environments": {
     "production": { "user": "nobody", "log_path": "/var/log/listd.log" }
   }
 }
 @endcode
 */

#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace sockd {

/**
 * @class ConfigValidator
 * @brief Валидатор конфигурации
 * @ingroup Configuration
 *
 * @note Все методы бросают std::runtime_error с префиксом "ConfigValidator:"
 */
class ConfigValidator {
 public:
  /**
   * @brief Проверка корня документа
   *
   * @details Корень должен быть объектом; если есть `defaults`, это объект;
   * если есть `environments`, это объект из объектов.
   */
  bool validateRoot(const nlohmann::json &config) const;

  /**
   * @brief Проверка итоговой секции параметров сервиса
   *
   * @details
   * - строки: name, host, socket, pid_path, log_path, user, group, log_level
   *   (socket, pid_path, log_path, user, group допускают null)
   * - port: целое 0..65535
   * - mode: целое 0..07777 или восьмеричная строка
   * - daemonize, force: логические значения
   * - *_timeout_ms: неотрицательные целые
   * - log_level: debug, info, warning, error, critical
   */
  bool validateService(const nlohmann::json &service) const;

 private:
  void validateString(const nlohmann::json &service, const std::string &key,
                      bool nullable) const;
  void validateBool(const nlohmann::json &service, const std::string &key) const;
  void validateTimeout(const nlohmann::json &service,
                       const std::string &key) const;
  void validatePort(const nlohmann::json &service) const;
  void validateMode(const nlohmann::json &service) const;
  void validateLogLevel(const nlohmann::json &service) const;
};

}  // namespace sockd
