/**
 * @file service_controller.cpp
 * @brief Реализация методов ServiceController
 *
 * @details
 *  - start(): демонизация, подтверждение запуска, обслуживание сокета
 *  - stop()/restart(): остановка по PID-файлу
 *  - send(): клиентский запрос к работающему экземпляру
 *  - run(): диспетчер команд
 */

#include "../include/service_controller.hpp"

#include <poll.h>
#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <thread>

#include "sockd/ControlProtocol.hpp"
#include "sockd/Credentials.hpp"
#include "sockd/DaemonManager.hpp"
#include "sockd/ServiceError.hpp"
#include "sockd/SignalRouter.hpp"
#include "sockd/SocketTransport.hpp"
#include "sockd/compositelogger.hpp"
#include "sockd/consolelogger.hpp"

namespace sockd {

namespace {

constexpr int kInterruptedExitCode = 130;
constexpr std::chrono::milliseconds kPingTimeout{1000};

std::string signalName(int signum) {
  switch (signum) {
    case SIGINT:
      return "SIGINT";
    case SIGQUIT:
      return "SIGQUIT";
    case SIGTERM:
      return "SIGTERM";
    default:
      return "signal " + std::to_string(signum);
  }
}

std::chrono::milliseconds remaining(std::chrono::steady_clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  return std::max(left, std::chrono::milliseconds(0));
}

bool isBrokenConnection(const std::system_error &e) {
  return e.code().value() == EPIPE || e.code().value() == ECONNRESET;
}

// Ошибки accept(), после которых слушающий сокет непригоден
bool isFatalAcceptError(const std::system_error &e) {
  switch (e.code().value()) {
    case EBADF:
    case EINVAL:
    case ENOTSOCK:
    case EOPNOTSUPP:
      return true;
    default:
      return false;
  }
}

}  // namespace

ServiceController::ServiceController(std::string name, ServiceConfig config,
                                     LifecycleHooks hooks)
    : identity_(std::move(name)),
      config_(std::move(config)),
      hooks_(std::move(hooks)) {
  initLogger();
}

void ServiceController::initLogger() {
  auto &composite = CompositeLogger::instance();
  if (composite.empty()) {
    composite.addLogger(unownedLogger(ConsoleLogger::instance()));
  }
  composite.setLogLevel(stringToLogLevel(config_.logLevel));
}

std::string ServiceController::pidPath() const {
  return config_.pidPath ? *config_.pidPath : identity_.defaultPidPath();
}

ProcessSupervisor ServiceController::makeSupervisor() const {
  ProcessSupervisor supervisor(pidPath(), name());
  supervisor.setStopTimeout(config_.stopTimeout);
  return supervisor;
}

ServiceController &ServiceController::setOnSetup(LifecycleHooks::SetupHook hook) {
  hooks_.onSetup = std::move(hook);
  return *this;
}

ServiceController &ServiceController::setOnTeardown(
    LifecycleHooks::TeardownHook hook) {
  hooks_.onTeardown = std::move(hook);
  return *this;
}

ServiceController &ServiceController::setOnHandle(LifecycleHooks::HandleHook hook) {
  hooks_.onHandle = std::move(hook);
  return *this;
}

void ServiceController::runSetup() {
  if (hooks_.onSetup) hooks_.onSetup(*this);
}

void ServiceController::runTeardown() {
  if (hooks_.onTeardown) hooks_.onTeardown(*this);
}

std::optional<std::string> ServiceController::runHandle(const std::string &message,
                                                        Connection &connection) {
  if (!hooks_.onHandle) {
    throw std::logic_error(name() + ": request handler is not installed");
  }
  return hooks_.onHandle(message, connection);
}

// ---------------------------------------------------------------------------
// start / stop / restart
// ---------------------------------------------------------------------------

void ServiceController::start() {
  if (!hooks_.onHandle) {
    throw std::logic_error(name() + ": request handler is not installed");
  }

  if (config_.daemonize) {
    startDaemon();
    return;
  }
  serve(nullptr);
}

void ServiceController::startDaemon() {
  auto &logger = CompositeLogger::instance();
  const ProcessSupervisor supervisor = makeSupervisor();

  if (auto pid = supervisor.isRunning()) {
    throw ServiceError(ErrorKind::AlreadyRunning,
                       name() + " process already running (" +
                           std::to_string(*pid) + ")");
  }
  logger.info("starting " + name() + " process...");

  if (config_.socketPath) {
    // После detach() рабочим каталогом становится "/"
    config_.socketPath = std::filesystem::absolute(*config_.socketPath).string();
  }

  const std::string pidFile = ProcessSupervisor::writableFile(pidPath());
  std::optional<std::string> logFile;
  if (config_.logPath) {
    logFile = ProcessSupervisor::writableFile(*config_.logPath);
  }

  DaemonManager daemon(pidFile, logFile);
  DaemonManager::Role role;
  try {
    role = daemon.detach();
  } catch (const std::exception &e) {
    if (!daemon.inChild()) throw;
    logger.critical(name() + ": daemonization failed: " + e.what());
    logger.flush();
    _exit(EXIT_FAILURE);
  }

  if (role == DaemonManager::Role::Parent) {
    confirmStart(supervisor);
    return;
  }

  // Исключение не должно вернуться в код, вызвавший start() в исходном процессе
  try {
    serve(&daemon);
  } catch (const std::exception &e) {
    logger.critical(name() + " failed: " + e.what());
    logger.flush();
    _exit(EXIT_FAILURE);
  }
}

void ServiceController::confirmStart(const ProcessSupervisor &supervisor) {
  const auto deadline = std::chrono::steady_clock::now() + config_.startTimeout;

  const bool spawned = waitUntil(config_.startTimeout, ProcessSupervisor::kPollInterval,
                                 [&] { return supervisor.isRunning().has_value(); });

  bool confirmed = false;
  if (spawned) {
    // Выход из ожидания и при гибели процесса: ждать дальше бессмысленно
    waitUntil(remaining(deadline), ProcessSupervisor::kPollInterval, [&] {
      if (!supervisor.isRunning()) return true;
      confirmed = answersPing(std::min(kPingTimeout, remaining(deadline)));
      return confirmed;
    });
  }

  if (!confirmed) {
    if (auto pid = supervisor.isRunning()) {
      auto &logger = CompositeLogger::instance();
      logger.warning(name() + " process (" + std::to_string(*pid) +
                     ") did not answer ping, stopping it");
      try {
        supervisor.stop(true);
      } catch (const ServiceError &e) {
        logger.error(e.what());
      }
    }
    throw ServiceError(ErrorKind::StartTimeout,
                       "failed to start " + name() + " process");
  }
  CompositeLogger::instance().info(
      name() + " process started (" +
      std::to_string(supervisor.storedPid().value_or(0)) + ")");
}

bool ServiceController::answersPing(std::chrono::milliseconds timeout) const {
  try {
    Connection connection = SocketTransport::openClient(config_, timeout);
    connection.writeFrame(protocol::kPingRequest);
    auto reply = connection.readLine(timeout);
    return reply && protocol::trimFrame(*reply) == protocol::kPongResponse;
  } catch (const std::system_error &) {
    return false;
  }
}

void ServiceController::stop() { makeSupervisor().stop(config_.force); }

void ServiceController::restart() {
  stop();
  start();
}

// ---------------------------------------------------------------------------
// send
// ---------------------------------------------------------------------------

std::string ServiceController::send(const std::string &message) {
  return send(message, config_.sendTimeout);
}

std::string ServiceController::send(const std::string &message,
                                    std::chrono::milliseconds timeout) {
  Connection connection;
  try {
    connection = SocketTransport::openClient(config_, timeout);
  } catch (const std::system_error &e) {
    if (!makeSupervisor().isRunning()) {
      throw ServiceError(ErrorKind::NotRunning, name() + " process not running");
    }
    throw ServiceError(ErrorKind::ConnectionError,
                       "unable to establish connection: " + std::string(e.what()));
  }

  try {
    connection.writeFrame(message);
    auto reply = connection.readLine(timeout);
    if (!reply) {
      throw ServiceError(ErrorKind::ConnectionError,
                         "timed out waiting for server response");
    }
    return protocol::trimFrame(*reply);
  } catch (const std::system_error &e) {
    throw ServiceError(ErrorKind::ConnectionError,
                       "connection to " + config_.endpointName() +
                           " failed: " + e.what());
  }
}

// ---------------------------------------------------------------------------
// Цикл обслуживания
// ---------------------------------------------------------------------------

void ServiceController::serve(DaemonManager *daemon) {
  auto &logger = CompositeLogger::instance();

  dropPrivileges(config_.user, config_.group);
  runSetup();

  SignalRouter router;
  for (int signum : {SIGINT, SIGQUIT, SIGTERM}) {
    router.registerHandler(signum, [this](int sig) { shutdownSignal_ = sig; });
  }
  if (daemon != nullptr) {
    router.registerHandler(SIGUSR1, [daemon, &logger](int) {
      try {
        daemon->reopenStreams();
        logger.info("log streams reopened");
      } catch (const std::system_error &e) {
        logger.error(std::string("unable to reopen log streams: ") + e.what());
      }
    });
  }

  {
    ServerSocket server = SocketTransport::openServer(config_);
    logger.info("listening on " + server.address());
    acceptLoop(server, router);
  }

  logger.info(signalName(shutdownSignal_) + " received, shutting down...");
  runTeardown();
  logger.flush();
  std::exit(kInterruptedExitCode);
}

void ServiceController::acceptLoop(ServerSocket &server, SignalRouter &router) {
  auto &logger = CompositeLogger::instance();

  while (shutdownSignal_ == 0) {
    pollfd fds[2] = {{server.fd(), POLLIN, 0}, {router.fd(), POLLIN, 0}};
    if (::poll(fds, 2, -1) < 0) {
      if (errno == EINTR) continue;
      throw std::system_error(errno, std::system_category(), "poll failed");
    }

    if (fds[1].revents & POLLIN) {
      router.dispatch();
      continue;
    }
    if (fds[0].revents & POLLIN) {
      Connection connection;
      try {
        connection = server.accept();
      } catch (const std::system_error &e) {
        if (isFatalAcceptError(e)) throw;
        // EMFILE, ENFILE, ENOBUFS: соединение остается в очереди
        logger.error(std::string("accept failed: ") + e.what());
        std::this_thread::sleep_for(ProcessSupervisor::kPollInterval);
        continue;
      }
      serveConnection(connection, router);
    }
  }
}

bool ServiceController::waitForRequest(Connection &connection,
                                       SignalRouter &router) {
  const auto deadline =
      std::chrono::steady_clock::now() + protocol::kReadReadinessTimeout;

  while (shutdownSignal_ == 0) {
    pollfd fds[2] = {{connection.fd(), POLLIN, 0}, {router.fd(), POLLIN, 0}};
    int rc = ::poll(fds, 2, static_cast<int>(remaining(deadline).count()));
    if (rc < 0) {
      if (errno == EINTR) continue;
      throw std::system_error(errno, std::system_category(), "poll failed");
    }
    if (rc == 0) return false;

    if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) return true;
    router.dispatch();
  }
  return false;
}

void ServiceController::serveConnection(Connection &connection,
                                        SignalRouter &router) {
  auto &logger = CompositeLogger::instance();

  try {
    if (!waitForRequest(connection, router)) {
      if (shutdownSignal_ == 0) logger.warning("connection timed out");
      return;
    }

    const std::string request = connection.peek(protocol::kPeekSize);
    if (request.empty()) {
      logger.debug("connection closed by peer");
      return;
    }

    if (protocol::isPing(request)) {
      connection.writeFrame(protocol::kPongResponse);
    } else if (auto response = runHandle(request, connection)) {
      connection.writeFrame(*response);
    }
    connection.discardPending();
  } catch (const std::system_error &e) {
    if (isBrokenConnection(e)) {
      logger.warning("connection broken");
    } else {
      logger.error(std::string("connection error: ") + e.what());
    }
  } catch (const std::exception &e) {
    logger.error(std::string("request handler failed: ") + e.what());
  }
  connection.close();
}

// ---------------------------------------------------------------------------
// Диспетчер команд
// ---------------------------------------------------------------------------

int ServiceController::run(const std::vector<std::string> &words) {
  auto &logger = CompositeLogger::instance();

  try {
    if (words.empty()) {
      config_.daemonize = false;
      start();
      return EXIT_SUCCESS;
    }

    const std::string &command = words.front();
    if (command == "start") {
      start();
    } else if (command == "stop") {
      stop();
    } else if (command == "restart") {
      restart();
    } else {
      auto first = command == "send" ? std::next(words.begin()) : words.begin();
      if (first == words.end()) {
        throw ServiceError(ErrorKind::BadCommand, "send requires a message");
      }

      std::string message = *first;
      for (auto it = std::next(first); it != words.end(); ++it) {
        message += ' ' + *it;
      }
      std::cout << send(message) << std::endl;
    }
    return EXIT_SUCCESS;
  } catch (const ServiceError &e) {
    logger.error(std::string(errorKindName(e.kind())) + ": " + e.what());
  } catch (const std::exception &e) {
    logger.critical(e.what());
  }
  return EXIT_FAILURE;
}

}  // namespace sockd
