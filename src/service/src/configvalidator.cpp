/**
 * @file configvalidator.cpp
 * @brief Реализация валидатора конфигурации сервиса
 */
#include "../include/configvalidator.hpp"

#include <vector>

#include "sockd/ServiceConfig.hpp"
#include "sockd/ilogger.hpp"

namespace sockd {

bool ConfigValidator::validateRoot(const nlohmann::json &config) const {
  if (!config.is_object()) {
    throw std::runtime_error("ConfigValidator: Configuration root must be an object");
  }

  if (config.contains("defaults") && !config["defaults"].is_object()) {
    throw std::runtime_error("ConfigValidator: Section defaults must be an object");
  }

  if (config.contains("environments")) {
    const auto &environments = config["environments"];
    if (!environments.is_object()) {
      throw std::runtime_error(
          "ConfigValidator: Section environments must be an object");
    }
    for (const auto &[env, section] : environments.items()) {
      if (!section.is_object()) {
        throw std::runtime_error("ConfigValidator: Environment " + env +
                                 " must be an object");
      }
    }
  }
  return true;
}

bool ConfigValidator::validateService(const nlohmann::json &service) const {
  if (!service.is_object()) {
    throw std::runtime_error("ConfigValidator: Service section must be an object");
  }

  validateString(service, "name", false);
  validateString(service, "host", false);
  validateString(service, "socket", true);
  validateString(service, "pid_path", true);
  validateString(service, "log_path", true);
  validateString(service, "user", true);
  validateString(service, "group", true);

  validateBool(service, "daemonize");
  validateBool(service, "force");

  const std::vector<std::string> timeouts = {
      "start_timeout_ms", "stop_timeout_ms", "reclaim_timeout_ms",
      "send_timeout_ms"};
  for (const auto &key : timeouts) {
    validateTimeout(service, key);
  }

  validatePort(service);
  validateMode(service);
  validateLogLevel(service);
  return true;
}

void ConfigValidator::validateString(const nlohmann::json &service,
                                     const std::string &key,
                                     bool nullable) const {
  if (!service.contains(key)) return;
  const auto &value = service[key];
  if (value.is_string() || (nullable && value.is_null())) return;
  throw std::runtime_error("ConfigValidator: Invalid type for " + key +
                           ": expected string");
}

void ConfigValidator::validateBool(const nlohmann::json &service,
                                   const std::string &key) const {
  if (service.contains(key) && !service[key].is_boolean()) {
    throw std::runtime_error("ConfigValidator: Invalid type for " + key +
                             ": expected boolean");
  }
}

void ConfigValidator::validateTimeout(const nlohmann::json &service,
                                      const std::string &key) const {
  if (!service.contains(key)) return;
  const auto &value = service[key];
  if (!value.is_number_integer() || value.get<long long>() < 0) {
    throw std::runtime_error("ConfigValidator: " + key +
                             " must be a non-negative integer");
  }
}

void ConfigValidator::validatePort(const nlohmann::json &service) const {
  if (!service.contains("port")) return;
  const auto &port = service["port"];
  if (!port.is_number_integer()) {
    throw std::runtime_error("ConfigValidator: Invalid port type");
  }
  const auto value = port.get<long long>();
  if (value < 0 || value > 65535) {
    throw std::runtime_error("ConfigValidator: Port out of range: " +
                             std::to_string(value));
  }
}

void ConfigValidator::validateMode(const nlohmann::json &service) const {
  if (!service.contains("mode")) return;
  const auto &mode = service["mode"];

  if (mode.is_number_integer()) {
    const auto value = mode.get<long long>();
    if (value < 0 || value > 07777) {
      throw std::runtime_error("ConfigValidator: Socket mode out of range: " +
                               std::to_string(value));
    }
    return;
  }

  if (mode.is_string()) {
    try {
      parseSocketMode(mode.get<std::string>());
    } catch (const std::invalid_argument &e) {
      throw std::runtime_error(std::string("ConfigValidator: ") + e.what());
    }
    return;
  }

  throw std::runtime_error(
      "ConfigValidator: Socket mode must be a number or an octal string");
}

void ConfigValidator::validateLogLevel(const nlohmann::json &service) const {
  if (!service.contains("log_level")) return;
  validateString(service, "log_level", false);
  try {
    stringToLogLevel(service["log_level"].get<std::string>());
  } catch (const std::invalid_argument &e) {
    throw std::runtime_error(std::string("ConfigValidator: ") + e.what());
  }
}

}  // namespace sockd
