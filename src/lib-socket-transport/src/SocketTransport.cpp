#include "sockd/SocketTransport.hpp"

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <system_error>

#include "sockd/ControlProtocol.hpp"
#include "sockd/Credentials.hpp"
#include "sockd/ServiceError.hpp"
#include "sockd/compositelogger.hpp"

namespace sockd {

namespace {

constexpr int kListenBacklog = SOMAXCONN;

/// Владеет дескриптором до передачи в Connection/ServerSocket
class FdGuard {
 public:
  explicit FdGuard(int fd) noexcept : fd_(fd) {}
  ~FdGuard() {
    if (fd_ >= 0) ::close(fd_);
  }
  FdGuard(const FdGuard&) = delete;
  FdGuard& operator=(const FdGuard&) = delete;

  int get() const noexcept { return fd_; }
  int release() noexcept {
    int fd = fd_;
    fd_ = -1;
    return fd;
  }

 private:
  int fd_;
};

[[noreturn]] void throwPermission(const ServiceConfig& config) {
  throw ServiceError(ErrorKind::TransportPermissionError,
                     "unable to open socket: " + config.endpointName() +
                         " (check permissions)");
}

bool isPermissionError(int err) { return err == EACCES || err == EPERM; }

sockaddr_un unixAddress(const std::string& path) {
  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
    throw std::system_error(ENAMETOOLONG, std::system_category(),
                            "invalid unix socket path: " + path);
  }
  std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
  return addr;
}

struct AddrInfoDeleter {
  void operator()(addrinfo* info) const { ::freeaddrinfo(info); }
};
using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

AddrInfoPtr resolve(const std::string& host, std::uint16_t port, bool passive) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_NUMERICSERV | (passive ? AI_PASSIVE : 0);

  addrinfo* result = nullptr;
  const std::string service = std::to_string(port);
  int rc = ::getaddrinfo(host.empty() ? nullptr : host.c_str(), service.c_str(),
                         &hints, &result);
  if (rc != 0) {
    throw std::runtime_error("getaddrinfo failed for " + host + ":" + service +
                             ": " + ::gai_strerror(rc));
  }
  return AddrInfoPtr(result);
}

/**
 * @brief connect() с ограничением по времени
 * @return 0 или код ошибки errno
 */
int connectWithTimeout(int fd, const sockaddr* addr, socklen_t len,
                       std::chrono::milliseconds timeout) {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
    return errno;
  }

  int err = 0;
  if (::connect(fd, addr, len) < 0) {
    err = errno;
    if (err == EINPROGRESS || err == EINTR) {
      pollfd pfd{fd, POLLOUT, 0};
      int rc;
      do {
        rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
      } while (rc < 0 && errno == EINTR);

      if (rc < 0) return errno;
      if (rc == 0) return ETIMEDOUT;

      socklen_t errLen = sizeof(err);
      if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &errLen) < 0) {
        return errno;
      }
    } else if (err == EAGAIN) {
      // Очередь Unix-сокета переполнена: сервер не принимает соединения
      return ETIMEDOUT;
    }
  }

  if (err == 0 && ::fcntl(fd, F_SETFL, flags) < 0) {
    return errno;
  }
  return err;
}

void applyOwnership(const ServiceConfig& config, const std::string& path) {
  const Ownership owner = resolveOwnership(config.user, config.group);
  if (!owner.empty()) {
    const uid_t uid = owner.uid ? *owner.uid : static_cast<uid_t>(-1);
    const gid_t gid = owner.gid ? *owner.gid : static_cast<gid_t>(-1);
    if (::chown(path.c_str(), uid, gid) < 0) {
      if (isPermissionError(errno)) throwPermission(config);
      throw std::system_error(errno, std::system_category(), "chown failed: " + path);
    }
  }

  if (config.socketMode != 0 && ::chmod(path.c_str(), config.socketMode) < 0) {
    if (isPermissionError(errno)) throwPermission(config);
    throw std::system_error(errno, std::system_category(), "chmod failed: " + path);
  }
}

ServerSocket openUnixServer(const ServiceConfig& config) {
  const std::string& path = *config.socketPath;
  const sockaddr_un addr = unixAddress(path);
  const auto* sa = reinterpret_cast<const sockaddr*>(&addr);

  FdGuard fd(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
  if (fd.get() < 0) {
    throw std::system_error(errno, std::system_category(), "socket(AF_UNIX) failed");
  }

  if (::bind(fd.get(), sa, sizeof(addr)) < 0) {
    int err = errno;
    struct stat st {};
    if (err == EADDRINUSE && ::lstat(path.c_str(), &st) == 0 && !S_ISSOCK(st.st_mode)) {
      // Обычный файл по этому пути не удаляется
      throw std::system_error(err, std::system_category(), "bind failed: " + path);
    }
    if (err == EADDRINUSE) {
      if (SocketTransport::probe(config, config.reclaimTimeout)) {
        throw ServiceError(ErrorKind::SocketInUse,
                           "socket " + path + " already in use by another process");
      }
      CompositeLogger::instance().info("removing stale socket " + path);
      if (::unlink(path.c_str()) < 0 && errno != ENOENT) {
        if (isPermissionError(errno)) throwPermission(config);
        throw std::system_error(errno, std::system_category(), "unlink failed: " + path);
      }
      err = ::bind(fd.get(), sa, sizeof(addr)) < 0 ? errno : 0;
    }
    if (err != 0) {
      if (isPermissionError(err)) throwPermission(config);
      throw std::system_error(err, std::system_category(), "bind failed: " + path);
    }
  }

  if (::listen(fd.get(), kListenBacklog) < 0) {
    throw std::system_error(errno, std::system_category(), "listen failed: " + path);
  }

  applyOwnership(config, path);
  return ServerSocket(fd.release(), path);
}

ServerSocket openTcpServer(const ServiceConfig& config) {
  AddrInfoPtr addresses = resolve(config.host, config.port, true);

  int lastError = EADDRNOTAVAIL;
  for (addrinfo* ai = addresses.get(); ai != nullptr; ai = ai->ai_next) {
    FdGuard fd(::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol));
    if (fd.get() < 0) {
      lastError = errno;
      continue;
    }

    int reuse = 1;
    ::setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    if (::bind(fd.get(), ai->ai_addr, ai->ai_addrlen) < 0 ||
        ::listen(fd.get(), kListenBacklog) < 0) {
      lastError = errno;
      continue;
    }

    ServerSocket server(fd.release(), "");
    // При port = 0 порт выбирает ядро
    const std::string address = config.host + ":" + std::to_string(server.port());
    return ServerSocket(server.release(), address);
  }

  if (isPermissionError(lastError)) throwPermission(config);
  if (lastError == EADDRINUSE) {
    throw ServiceError(ErrorKind::SocketInUse,
                       "address " + config.endpointName() + " already in use");
  }
  throw std::system_error(lastError, std::system_category(),
                          "unable to listen on " + config.endpointName());
}

}  // namespace

ServerSocket SocketTransport::openServer(const ServiceConfig& config) {
  return config.usesUnixSocket() ? openUnixServer(config) : openTcpServer(config);
}

Connection SocketTransport::openClient(const ServiceConfig& config,
                                       std::chrono::milliseconds timeout) {
  if (config.usesUnixSocket()) {
    const sockaddr_un addr = unixAddress(*config.socketPath);
    FdGuard fd(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (fd.get() < 0) {
      throw std::system_error(errno, std::system_category(), "socket(AF_UNIX) failed");
    }
    int err = connectWithTimeout(fd.get(), reinterpret_cast<const sockaddr*>(&addr),
                                 sizeof(addr), timeout);
    if (err != 0) {
      if (isPermissionError(err)) throwPermission(config);
      throw std::system_error(err, std::system_category(),
                              "connect failed: " + config.endpointName());
    }
    return Connection(fd.release());
  }

  AddrInfoPtr addresses = resolve(config.host, config.port, false);
  int lastError = EADDRNOTAVAIL;
  for (addrinfo* ai = addresses.get(); ai != nullptr; ai = ai->ai_next) {
    FdGuard fd(::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol));
    if (fd.get() < 0) {
      lastError = errno;
      continue;
    }
    lastError = connectWithTimeout(fd.get(), ai->ai_addr, ai->ai_addrlen, timeout);
    if (lastError == 0) {
      return Connection(fd.release());
    }
  }

  if (isPermissionError(lastError)) throwPermission(config);
  throw std::system_error(lastError, std::system_category(),
                          "connect failed: " + config.endpointName());
}

bool SocketTransport::probe(const ServiceConfig& config,
                            std::chrono::milliseconds timeout) {
  const auto started = std::chrono::steady_clock::now();
  try {
    Connection connection = openClient(config, timeout);
    connection.writeFrame(protocol::kPingRequest);

    const auto spent = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    auto reply = connection.readLine(timeout > spent ? timeout - spent
                                                     : std::chrono::milliseconds(0));
    return reply && !reply->empty();
  } catch (const std::system_error& e) {
    CompositeLogger::instance().debug("probe of " + config.endpointName() +
                                      " failed: " + e.what());
    return false;
  }
}

}  // namespace sockd
