/**
 * @file environmentprocessor.hpp
 * @brief Подстановка значений переменных окружения в JSON-конфигурацию
 *
 * @details
 * Шаблоны `$ENV{VAR}` заменяются в любом строковом узле, включая вложенные
 * объекты и массивы. Позволяет держать в одном файле пути вида
 * `"$ENV{HOME}/run/listd.sock"`. Форма `$ENV{VAR:-value}` задает значение
 * для неустановленной переменной.
 *
 * @warning Шаблон без значения по умолчанию заменяется пустой строкой, если
 * переменная не установлена
 */

#pragma once

#include <functional>
#include <nlohmann/json.hpp>
#include <string>

namespace sockd {

/**
 * @class EnvironmentProcessor
 * @brief Обработка шаблонов переменных окружения в конфиге
 * @ingroup Configuration
 */
class EnvironmentProcessor {
 public:
  /**
     * @brief Выполняет подстановку во всех строковых узлах
     *
     * @code
     nlohmann::json cfg = R"({"socket": "$ENV{HOME}/listd.sock"})"_json;
     EnvironmentProcessor().process(cfg);
     @endcode
     */
  void process(nlohmann::json &config) const;

  /// Заменяет все вхождения `$ENV{VAR}` и `$ENV{VAR:-value}` в строке
  void resolveVariable(std::string &value) const;

 private:
  void walkJson(nlohmann::json &node,
                const std::function<void(std::string &)> &func) const;
};

}  // namespace sockd
