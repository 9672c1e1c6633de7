#include "sockd/SignalRouter.hpp"

#include <poll.h>
#include <sys/signalfd.h>
#include <unistd.h>

#include <cerrno>
#include <stdexcept>
#include <system_error>

namespace sockd {

SignalRouter::SignalRouter() {
  sigemptyset(&blocked_mask_);
  if (pthread_sigmask(SIG_SETMASK, nullptr, &original_mask_) != 0) {
    throw std::system_error(errno, std::system_category(),
                            "pthread_sigmask(GET) failed");
  }
  if ((signal_fd_ = signalfd(-1, &blocked_mask_, SFD_NONBLOCK | SFD_CLOEXEC)) ==
      -1) {
    throw std::system_error(errno, std::system_category(),
                            "signalfd create failed");
  }
}

SignalRouter::~SignalRouter() {
  close(signal_fd_);
  pthread_sigmask(SIG_SETMASK, &original_mask_, nullptr);
}

void SignalRouter::registerHandler(int signum, Handler handler) {
  if (signum <= 0 || signum >= NSIG || signum == SIGKILL || signum == SIGSTOP) {
    throw std::invalid_argument("Invalid signal number: " +
                                std::to_string(signum));
  }

  sigset_t updated = blocked_mask_;
  sigaddset(&updated, signum);

  // Сигнал блокируется до обновления signalfd, чтобы не потерять доставку
  if (int rc = pthread_sigmask(SIG_BLOCK, &updated, nullptr); rc != 0) {
    throw std::system_error(rc, std::system_category(),
                            "pthread_sigmask(BLOCK) failed");
  }
  if (signalfd(signal_fd_, &updated, 0) == -1) {
    throw std::system_error(errno, std::system_category(),
                            "signalfd configure failed");
  }

  blocked_mask_ = updated;
  handlers_[signum].push_back(std::move(handler));
}

void SignalRouter::unregisterHandler(int signum) { handlers_.erase(signum); }

int SignalRouter::dispatch() {
  int handled = 0;
  while (true) {
    signalfd_siginfo fdsi;
    ssize_t bytes = read(signal_fd_, &fdsi, sizeof(fdsi));
    if (bytes != static_cast<ssize_t>(sizeof(fdsi))) {
      if (bytes == -1 && errno == EINTR) continue;
      break;  // EAGAIN: очередь пуста
    }

    ++handled;
    const int signo = static_cast<int>(fdsi.ssi_signo);
    if (auto it = handlers_.find(signo); it != handlers_.end()) {
      // Копия: обработчик может снять регистрацию
      auto handlers = it->second;
      for (auto& handler : handlers) {
        handler(signo);
      }
    }
  }
  return handled;
}

bool SignalRouter::waitAndDispatch(std::chrono::milliseconds timeout) {
  pollfd pfd{signal_fd_, POLLIN, 0};
  int rc = poll(&pfd, 1, static_cast<int>(timeout.count()));
  if (rc < 0) {
    if (errno == EINTR) return false;
    throw std::system_error(errno, std::system_category(), "poll failed");
  }
  if (rc == 0) return false;
  return dispatch() > 0;
}

}  // namespace sockd
