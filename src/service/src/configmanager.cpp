#include "../include/configmanager.hpp"

#include <chrono>
#include <fstream>
#include <optional>
#include <stdexcept>

namespace sockd {

namespace {

std::optional<std::string> optionalString(const nlohmann::json &service,
                                          const char *key) {
  if (!service.contains(key) || service[key].is_null()) return std::nullopt;
  auto value = service[key].get<std::string>();
  if (value.empty()) return std::nullopt;
  return value;
}

void readTimeout(const nlohmann::json &service, const char *key,
                 std::chrono::milliseconds &target) {
  if (service.contains(key)) {
    target = std::chrono::milliseconds(service[key].get<long long>());
  }
}

nlohmann::json optionalJson(const std::optional<std::string> &value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}  // namespace

void ConfigManager::initialize(const std::string &filename) {
  initializeFromJson(loader_.loadFromFile(filename));
}

void ConfigManager::initializeFromJson(nlohmann::json config) {
  envProcessor_.process(config);
  validator_.validateRoot(config);
  baseConfig_ = std::move(config);
}

nlohmann::json ConfigManager::getMergedConfig(const std::string &env) const {
  if (!baseConfig_.contains("defaults") && !baseConfig_.contains("environments")) {
    return baseConfig_;
  }

  nlohmann::json merged = baseConfig_.value("defaults", nlohmann::json::object());
  if (env.empty()) {
    return merged;
  }

  if (!baseConfig_.contains("environments") ||
      !baseConfig_["environments"].contains(env)) {
    throw std::runtime_error("ConfigManager: Unknown environment: " + env);
  }
  merged.merge_patch(baseConfig_["environments"][env]);
  return merged;
}

ServiceConfig ConfigManager::serviceConfig(const std::string &env) const {
  const auto merged = getMergedConfig(env);
  validator_.validateService(merged);
  return fromJson(merged);
}

std::string ConfigManager::serviceName(const std::string &env,
                                       const std::string &fallback) const {
  const auto merged = getMergedConfig(env);
  if (merged.contains("name") && merged["name"].is_string()) {
    return merged["name"].get<std::string>();
  }
  return fallback;
}

ServiceConfig ConfigManager::fromJson(const nlohmann::json &service) {
  ServiceConfig config;

  if (auto socket = optionalString(service, "socket")) {
    config.useUnixSocket(*socket);
  } else {
    config.useTcp(service.value("host", config.host),
                  static_cast<std::uint16_t>(service.value("port", 0)));
  }

  if (service.contains("mode")) {
    const auto &mode = service["mode"];
    config.socketMode = mode.is_string()
                            ? parseSocketMode(mode.get<std::string>())
                            : static_cast<mode_t>(mode.get<unsigned>());
  }

  config.daemonize = service.value("daemonize", config.daemonize);
  config.force = service.value("force", config.force);
  config.pidPath = optionalString(service, "pid_path");
  config.logPath = optionalString(service, "log_path");
  config.user = optionalString(service, "user");
  config.group = optionalString(service, "group");
  config.logLevel = service.value("log_level", config.logLevel);

  readTimeout(service, "start_timeout_ms", config.startTimeout);
  readTimeout(service, "stop_timeout_ms", config.stopTimeout);
  readTimeout(service, "reclaim_timeout_ms", config.reclaimTimeout);
  readTimeout(service, "send_timeout_ms", config.sendTimeout);
  return config;
}

nlohmann::json ConfigManager::toJson(const std::string &name,
                                     const ServiceConfig &config) {
  nlohmann::json service;
  service["name"] = name;
  service["host"] = config.host;
  service["port"] = config.port;
  service["socket"] = optionalJson(config.socketPath);
  service["mode"] = config.socketMode;
  service["daemonize"] = config.daemonize;
  service["pid_path"] = optionalJson(config.pidPath);
  service["log_path"] = optionalJson(config.logPath);
  service["force"] = config.force;
  service["user"] = optionalJson(config.user);
  service["group"] = optionalJson(config.group);
  service["log_level"] = config.logLevel;
  service["start_timeout_ms"] = config.startTimeout.count();
  service["stop_timeout_ms"] = config.stopTimeout.count();
  service["reclaim_timeout_ms"] = config.reclaimTimeout.count();
  service["send_timeout_ms"] = config.sendTimeout.count();
  return service;
}

void ConfigManager::save(const std::string &filename, const std::string &name,
                         const ServiceConfig &config) {
  std::ofstream file(filename, std::ios::trunc);
  if (!file.is_open()) {
    throw std::runtime_error("ConfigManager: Failed to open file for writing: " +
                             filename);
  }
  file << toJson(name, config).dump(2) << '\n';
  if (!file.good()) {
    throw std::runtime_error("ConfigManager: Failed to write " + filename);
  }
}

}  // namespace sockd
