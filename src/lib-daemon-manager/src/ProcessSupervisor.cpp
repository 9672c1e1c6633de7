#include "sockd/ProcessSupervisor.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <thread>

#include "sockd/ServiceError.hpp"
#include "sockd/compositelogger.hpp"

namespace sockd {

bool waitUntil(std::chrono::milliseconds timeout,
               std::chrono::milliseconds interval,
               const std::function<bool()>& predicate) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (predicate()) return true;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(interval);
    }
}

ProcessSupervisor::ProcessSupervisor(std::optional<std::string> pidPath, std::string name)
    : pidPath_(std::move(pidPath)), name_(std::move(name)) {}

std::optional<pid_t> ProcessSupervisor::storedPid() const {
    if (!pidPath_) return std::nullopt;

    std::ifstream file(std::filesystem::absolute(*pidPath_));
    if (!file) return std::nullopt;

    long pid = 0;
    if (!(file >> pid) || pid <= 0) {
        // 0 и отрицательные значения адресовали бы группу процессов в kill()
        return std::nullopt;
    }
    return static_cast<pid_t>(pid);
}

std::optional<pid_t> ProcessSupervisor::isRunning() const {
    auto pid = storedPid();
    if (!pid || !isAlive(*pid)) return std::nullopt;
    return pid;
}

bool ProcessSupervisor::isAlive(pid_t pid) noexcept {
    if (kill(pid, 0) == 0) return true;
    return errno != ESRCH;
}

void ProcessSupervisor::stop(bool force) const {
    auto& logger = CompositeLogger::instance();

    auto pid = isRunning();
    if (!pid) {
        logger.warning(name_ + " process not running");
        return;
    }

    auto stopped = [target = *pid] { return !isAlive(target); };

    if (kill(*pid, SIGTERM) == 0) {
        logger.info("SIGTERM sent to " + name_ + " (" + std::to_string(*pid) + ")");
    }

    if (!waitUntil(stopTimeout_, kPollInterval, stopped) && force) {
        if (kill(*pid, SIGKILL) == 0) {
            logger.warning("SIGKILL sent to " + name_ + " (" + std::to_string(*pid) + ")");
        }
        waitUntil(stopTimeout_, kPollInterval, stopped);
    }

    if (isAlive(*pid)) {
        throw ServiceError(ErrorKind::StopFailed, "unable to stop " + name_ + " process");
    }
}

std::string ProcessSupervisor::writableFile(const std::string& path) {
    namespace fs = std::filesystem;
    std::error_code ec;
    const fs::path target = fs::absolute(path, ec);
    if (ec) {
        throw ServiceError(ErrorKind::PathPermissionError,
                           "unable to open file: " + path + " (check permissions)");
    }

    // mkdir -p с правами 0755 для каждого созданного каталога
    fs::path current;
    for (const auto& part : target.parent_path()) {
        current /= part;
        if (::mkdir(current.c_str(), 0755) < 0 && errno != EEXIST) {
            break;
        }
    }

    int fd = ::open(target.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
    if (fd >= 0) {
        ::close(fd);
        ::chmod(target.c_str(), 0644);
    }

    if (!fs::is_regular_file(target, ec) || ::access(target.c_str(), W_OK) != 0) {
        throw ServiceError(ErrorKind::PathPermissionError,
                           "unable to open file: " + target.string() + " (check permissions)");
    }
    return target.string();
}

} // namespace sockd
