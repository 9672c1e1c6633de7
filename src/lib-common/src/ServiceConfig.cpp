#include "sockd/ServiceConfig.hpp"

#include <cctype>
#include <stdexcept>

namespace sockd {

void ServiceConfig::useUnixSocket(const std::string& path) {
  socketPath = path;
}

void ServiceConfig::useTcp(const std::string& tcpHost, std::uint16_t tcpPort) {
  host = tcpHost;
  port = tcpPort;
  socketPath.reset();
}

std::string ServiceConfig::endpointName() const {
  if (socketPath) return *socketPath;
  return host + ":" + std::to_string(port);
}

mode_t parseSocketMode(const std::string& text) {
  std::string digits = text;
  if (digits.size() > 2 && digits[0] == '0' &&
      (digits[1] == 'o' || digits[1] == 'O')) {
    digits.erase(0, 2);
  }
  if (digits.empty()) {
    throw std::invalid_argument("Invalid socket mode: '" + text + "'");
  }

  mode_t mode = 0;
  for (char c : digits) {
    if (c < '0' || c > '7') {
      throw std::invalid_argument("Invalid socket mode: '" + text + "'");
    }
    mode = mode * 8 + static_cast<mode_t>(c - '0');
    if (mode > 07777) {
      throw std::invalid_argument("Socket mode out of range: '" + text + "'");
    }
  }
  return mode;
}

ServiceIdentity::ServiceIdentity(std::string name)
    : name_(std::move(name)), safeName_(sanitize(name_)) {}

std::string ServiceIdentity::defaultPidPath() const {
  return "/var/run/" + safeName_ + ".pid";
}

std::string ServiceIdentity::sanitize(const std::string& name) {
  std::size_t start = 0;
  while (start < name.size() &&
         std::isdigit(static_cast<unsigned char>(name[start]))) {
    ++start;
  }

  std::string result;
  for (std::size_t i = start; i < name.size(); ++i) {
    const auto c = static_cast<unsigned char>(name[i]);
    if (c < 0x80 && std::isalnum(c)) {
      result.push_back(name[i]);
    }
  }
  return result;
}

}  // namespace sockd
