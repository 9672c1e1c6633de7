/**
 * @file configloader.hpp
 * @brief Загрузчик конфигурации сервиса из JSON-файла
 *
 * @details
 * Читает файл целиком и разбирает его nlohmann/json. Синтаксические ошибки
 * переводятся в std::runtime_error с указанием смещения в байтах, чтобы
 * вызывающему коду было достаточно одного типа исключения.
 *
 * @see ConfigManager
 */

#pragma once
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

/**
 * @defgroup Configuration Компоненты управления конфигурацией
 */

namespace sockd {

/**
 * @class ConfigLoader
 * @brief Чтение JSON-конфигурации с диска
 * @ingroup Configuration
 *
 * @note Класс не является потокобезопасным
 */
class ConfigLoader {
 public:
  /**
     * @brief Загружает конфигурацию из указанного JSON-файла
     *
     * @param[in] filename Путь к JSON-файлу (относительный или абсолютный)
     * @return nlohmann::json Распарсенная конфигурация
     *
     * @throw std::runtime_error Если файл не открывается или содержит
     * некорректный JSON (сообщение содержит позицию ошибки)
     *
     * @code
     ConfigLoader loader;
     auto config = loader.loadFromFile("/etc/listd.json");
     @endcode
     */
  nlohmann::json loadFromFile(const std::string &filename);

  /// Путь к последнему загруженному файлу или пустая строка
  const std::string &getLastLoadedFile() const { return lastLoadedFile; }

 private:
  nlohmann::json readFileContents(const std::string &filename) const;

  std::string lastLoadedFile;
};

}  // namespace sockd
