/**
 * @file configmanager.hpp
 * @brief Загрузка, слияние окружений и преобразование конфигурации сервиса
 *
 * @details
 * ConfigManager объединяет ConfigLoader, EnvironmentProcessor и
 * ConfigValidator и выдает готовый ServiceConfig для выбранного окружения.
 * Секция `defaults` сливается с `environments.<env>` через merge_patch:
 * значение null в окружении удаляет ключ и возвращает значение по умолчанию.
 *
 * @warning Не потокобезопасен
 */

#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "../include/configloader.hpp"
#include "../include/configvalidator.hpp"
#include "../include/environmentprocessor.hpp"
#include "sockd/ServiceConfig.hpp"

namespace sockd {

/**
 * @class ConfigManager
 * @brief Конфигурация сервиса из JSON-файла
 * @ingroup Configuration
 *
 * @code
 ConfigManager manager;
 manager.initialize("/etc/listd.json");
 ServiceController controller(manager.serviceName("production", "listd"),
                              manager.serviceConfig("production"));
 @endcode
 */
class ConfigManager {
 public:
  /**
   * @brief Загрузить файл, подставить переменные окружения, проверить корень
   * @throw std::runtime_error при ошибках чтения, разбора или структуры
   */
  void initialize(const std::string &filename);

  /**
   * @brief Использовать уже разобранный документ (без чтения файла)
   * @throw std::runtime_error при ошибках структуры
   */
  void initializeFromJson(nlohmann::json config);

  /**
   * @brief Итоговая секция для окружения
   *
   * @details Без секции `defaults` весь документ считается секцией сервиса.
   * Пустое имя окружения означает только `defaults`.
   *
   * @throw std::runtime_error если окружение не описано в `environments`
   */
  nlohmann::json getMergedConfig(const std::string &env) const;

  /**
   * @brief Проверенный ServiceConfig для окружения
   * @throw std::runtime_error при ошибках валидации
   */
  ServiceConfig serviceConfig(const std::string &env) const;

  /// Значение ключа `name` или fallback
  std::string serviceName(const std::string &env,
                          const std::string &fallback) const;

  const std::string &configPath() const { return loader_.getLastLoadedFile(); }

  /**
   * @brief Преобразовать проверенную секцию в ServiceConfig
   *
   * @details Непустой `socket` выбирает Unix-сокет, `host`/`port` при этом
   * игнорируются.
   */
  static ServiceConfig fromJson(const nlohmann::json &service);

  /// Обратное преобразование; отсутствующие значения записываются как null
  static nlohmann::json toJson(const std::string &name,
                               const ServiceConfig &config);

  /**
   * @brief Сохранить конфигурацию в файл (плоский формат, отступ 2)
   * @throw std::runtime_error если файл не открывается для записи
   */
  static void save(const std::string &filename, const std::string &name,
                   const ServiceConfig &config);

 private:
  ConfigLoader loader_;
  EnvironmentProcessor envProcessor_;
  ConfigValidator validator_;
  nlohmann::json baseConfig_;
};

}  // namespace sockd
