#include "sockd/ControlProtocol.hpp"

namespace sockd::protocol {

std::string frame(const std::string& message) {
  return message + kTerminator;
}

std::string trimFrame(const std::string& raw) {
  std::string result = raw;
  if (!result.empty() && result.back() == '\n') {
    result.pop_back();
  }
  if (!result.empty() && result.back() == '\r') {
    result.pop_back();
  }
  return result;
}

bool isPing(const std::string& raw) {
  return trimFrame(raw) == kPingRequest;
}

}  // namespace sockd::protocol
