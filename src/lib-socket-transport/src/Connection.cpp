#include "sockd/Connection.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>

#include "sockd/ControlProtocol.hpp"

namespace sockd {

namespace {

int remainingMs(std::chrono::steady_clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

}  // namespace

bool pollReadable(int fd, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    pollfd pfd{fd, POLLIN, 0};
    int rc = ::poll(&pfd, 1, remainingMs(deadline));
    if (rc > 0) return true;
    if (rc == 0) return false;
    if (errno != EINTR) {
      throw std::system_error(errno, std::system_category(), "poll failed");
    }
  }
}

// ---------------------------------------------------------------------------
// Connection
// ---------------------------------------------------------------------------

Connection::~Connection() { close(); }

Connection::Connection(Connection&& other) noexcept : fd_(other.fd_) {
  other.fd_ = -1;
}

Connection& Connection::operator=(Connection&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

bool Connection::waitReadable(std::chrono::milliseconds timeout) const {
  return pollReadable(fd_, timeout);
}

std::string Connection::peek(std::size_t size) const {
  std::string buffer(size, '\0');
  ssize_t received;
  do {
    received = ::recv(fd_, buffer.data(), size, MSG_PEEK);
  } while (received < 0 && errno == EINTR);

  if (received < 0) {
    throw std::system_error(errno, std::system_category(), "recv(MSG_PEEK) failed");
  }
  buffer.resize(static_cast<std::size_t>(received));
  return buffer;
}

std::optional<std::string> Connection::readLine(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::string line;
  char ch = 0;

  while (true) {
    if (!pollReadable(fd_, std::chrono::milliseconds(remainingMs(deadline)))) {
      return std::nullopt;
    }
    ssize_t received = ::recv(fd_, &ch, 1, 0);
    if (received < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      throw std::system_error(errno, std::system_category(), "recv failed");
    }
    if (received == 0) {
      return line;  // клиент закрыл соединение
    }
    line.push_back(ch);
    if (ch == '\n') {
      return line;
    }
  }
}

void Connection::write(const std::string& data) {
  std::size_t sent = 0;
  while (sent < data.size()) {
    ssize_t written = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (written < 0) {
      if (errno == EINTR) continue;
      throw std::system_error(errno, std::system_category(), "send failed");
    }
    sent += static_cast<std::size_t>(written);
  }
}

void Connection::writeFrame(const std::string& message) {
  write(protocol::frame(message));
}

void Connection::discardPending() noexcept {
  char buffer[512];
  while (fd_ >= 0) {
    ssize_t received = ::recv(fd_, buffer, sizeof(buffer), MSG_DONTWAIT);
    if (received > 0) continue;
    if (received < 0 && errno == EINTR) continue;
    break;
  }
}

void Connection::close() noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

// ---------------------------------------------------------------------------
// ServerSocket
// ---------------------------------------------------------------------------

ServerSocket::ServerSocket(int fd, std::string address) noexcept
    : fd_(fd), address_(std::move(address)) {}

ServerSocket::~ServerSocket() { close(); }

ServerSocket::ServerSocket(ServerSocket&& other) noexcept
    : fd_(other.fd_), address_(std::move(other.address_)) {
  other.fd_ = -1;
}

ServerSocket& ServerSocket::operator=(ServerSocket&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = other.fd_;
    address_ = std::move(other.address_);
    other.fd_ = -1;
  }
  return *this;
}

Connection ServerSocket::accept() {
  while (true) {
    int client = ::accept4(fd_, nullptr, nullptr, SOCK_CLOEXEC);
    if (client >= 0) return Connection(client);
    if (errno == EINTR || errno == ECONNABORTED) continue;
    throw std::system_error(errno, std::system_category(), "accept failed");
  }
}

std::uint16_t ServerSocket::port() const {
  sockaddr_storage addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
    throw std::system_error(errno, std::system_category(), "getsockname failed");
  }
  if (addr.ss_family == AF_INET) {
    return ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
  }
  if (addr.ss_family == AF_INET6) {
    return ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port);
  }
  return 0;
}

int ServerSocket::release() noexcept {
  int fd = fd_;
  fd_ = -1;
  return fd;
}

void ServerSocket::close() noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

}  // namespace sockd
