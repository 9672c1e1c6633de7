#include "../include/environmentprocessor.hpp"

#include <cstdlib>
#include <optional>

namespace sockd {

void EnvironmentProcessor::process(nlohmann::json &config) const {
  walkJson(config, [this](std::string &value) { resolveVariable(value); });
}

void EnvironmentProcessor::walkJson(
    nlohmann::json &node,
    const std::function<void(std::string &)> &func) const {
  if (node.is_object() || node.is_array()) {
    for (auto &element : node) {
      walkJson(element, func);
    }
  } else if (node.is_string()) {
    auto str = node.get<std::string>();
    func(str);
    node = str;
  }
}

void EnvironmentProcessor::resolveVariable(std::string &value) const {
  static const std::string prefix = "$ENV{";
  static const std::string fallbackMark = ":-";
  std::size_t pos = 0;

  while ((pos = value.find(prefix, pos)) != std::string::npos) {
    const std::size_t close = value.find('}', pos + prefix.size());
    if (close == std::string::npos) break;

    std::string name = value.substr(pos + prefix.size(), close - pos - prefix.size());
    std::optional<std::string> fallback;
    if (auto mark = name.find(fallbackMark); mark != std::string::npos) {
      fallback = name.substr(mark + fallbackMark.size());
      name.resize(mark);
    }

    // Неопределенная переменная без значения по умолчанию дает пустую строку
    const char *env = std::getenv(name.c_str());
    const std::string replacement = env != nullptr ? env : fallback.value_or("");
    value.replace(pos, close - pos + 1, replacement);
    pos += replacement.size();
  }
}

}  // namespace sockd
