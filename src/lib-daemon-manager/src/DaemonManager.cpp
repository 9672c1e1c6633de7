#include "sockd/DaemonManager.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace sockd {

namespace {

std::optional<std::filesystem::path> absoluteOrEmpty(const std::optional<std::string>& path) {
    if (!path || path->empty()) return std::nullopt;
    return std::filesystem::absolute(*path);
}

void redirectFd(int fd, const char* path, int flags) {
    int opened = ::open(path, flags | O_CLOEXEC, 0644);
    if (opened < 0) {
        throw std::system_error(errno, std::system_category(),
            std::string("DaemonManager: failed to open ") + path);
    }
    if (::dup2(opened, fd) < 0) {
        int err = errno;
        ::close(opened);
        throw std::system_error(err, std::system_category(), "DaemonManager: dup2 failed");
    }
    ::close(opened);
}

} // namespace

DaemonManager::DaemonManager(std::optional<std::string> pidPath, std::optional<std::string> logPath)
    : mPidPath(absoluteOrEmpty(pidPath)), mLogPath(absoluteOrEmpty(logPath)) {}

DaemonManager::Role DaemonManager::detach() {
    if (sDetached.load()) {
        throw std::logic_error("DaemonManager: detach(): process is already detached");
    }

    // Буферы не должны продублироваться в потомках
    std::cout.flush();
    std::cerr.flush();
    std::fflush(nullptr);

    // Первый fork
    if (pid_t pid = fork(); pid < 0) {
        throw std::system_error(errno, std::system_category(), "DaemonManager: detach(): First fork failed");
    } else if (pid > 0) {
        // Промежуточный процесс завершается сразу после второго fork
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        return Role::Parent;
    }

    mInChild = true;
    sDetached.store(true);

    if (setsid() < 0) {
        throw std::system_error(errno, std::system_category(), "DaemonManager: detach(): setsid failed");
    }

    // Второй fork: лидер сессии завершается
    if (pid_t pid = fork(); pid < 0) {
        throw std::system_error(errno, std::system_category(), "DaemonManager: detach(): Second fork failed");
    } else if (pid > 0) {
        _exit(EXIT_SUCCESS);
    }

    umask(0);
    if (chdir("/") < 0) {
        throw std::system_error(errno, std::system_category(), "DaemonManager: detach(): chdir failed");
    }

    if (mPidPath) {
        writePid();
    }

    redirectStreams();

    signal(SIGHUP, SIG_IGN);

    sigset_t usr1;
    sigemptyset(&usr1);
    sigaddset(&usr1, SIGUSR1);
    pthread_sigmask(SIG_BLOCK, &usr1, nullptr);

    return Role::Child;
}

void DaemonManager::writePid() {
    if (!mPidPath) return;

    std::ofstream file(*mPidPath, std::ios::trunc);
    if (!file.is_open()) {
        throw std::system_error(errno, std::system_category(),
            "DaemonManager: writePid(): Failed to open PID file: " + mPidPath->string());
    }
    file << getpid() << '\n';
    file.flush();
    if (!file.good()) {
        throw std::system_error(errno, std::system_category(),
            "DaemonManager: writePid(): Failed to write PID to file: " + mPidPath->string());
    }

    if (chmod(mPidPath->c_str(), 0644) < 0) {
        throw std::system_error(errno, std::system_category(),
            "DaemonManager: writePid(): Failed to set PID file permissions");
    }
}

void DaemonManager::redirectStreams() {
    std::cout.flush();
    std::cerr.flush();
    std::fflush(nullptr);

    const std::string logTarget = mLogPath ? mLogPath->string() : "/dev/null";

    redirectFd(STDIN_FILENO, "/dev/null", O_RDONLY);
    redirectFd(STDOUT_FILENO, logTarget.c_str(), O_WRONLY | O_CREAT | O_APPEND);
    if (::dup2(STDOUT_FILENO, STDERR_FILENO) < 0) {
        throw std::system_error(errno, std::system_category(), "DaemonManager: dup2(stderr) failed");
    }
}

} // namespace sockd
