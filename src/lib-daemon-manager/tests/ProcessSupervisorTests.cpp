#include <gtest/gtest.h>

#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>

#include "sockd/ProcessSupervisor.hpp"
#include "sockd/ServiceError.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

// Дочерний процесс, который ждет сигнала; при ignoreTerm SIGTERM игнорируется
pid_t spawnSleeper(bool ignoreTerm) {
    int ready[2];
    if (pipe(ready) != 0) return -1;

    pid_t pid = fork();
    if (pid == 0) {
        close(ready[0]);
        if (ignoreTerm) signal(SIGTERM, SIG_IGN);
        char byte = 'x';
        (void)!write(ready[1], &byte, 1);
        close(ready[1]);
        for (;;) pause();
    }

    close(ready[1]);
    char byte;
    (void)!read(ready[0], &byte, 1);
    close(ready[0]);
    return pid;
}

// Собирает статус потомка, иначе kill(pid, 0) видел бы зомби живым
class Reaper {
public:
    explicit Reaper(pid_t pid)
        : thread_([this, pid] {
              int status = 0;
              while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
              status_ = status;
          }) {}
    ~Reaper() { if (thread_.joinable()) thread_.join(); }

    int join() {
        thread_.join();
        return status_;
    }

private:
    std::atomic<int> status_{0};
    std::thread thread_;
};

} // namespace

class ProcessSupervisorTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("sockd_supervisor_" + std::to_string(getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
        pidPath_ = (dir_ / "test.pid").string();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void writePidFile(const std::string& content) {
        std::ofstream(pidPath_) << content;
    }

    fs::path dir_;
    std::string pidPath_;
};

TEST_F(ProcessSupervisorTest, NoPidPathMeansNotRunning) {
    sockd::ProcessSupervisor supervisor(std::nullopt, "test");
    EXPECT_FALSE(supervisor.storedPid().has_value());
    EXPECT_FALSE(supervisor.isRunning().has_value());
}

TEST_F(ProcessSupervisorTest, MissingOrEmptyFileMeansNotRunning) {
    sockd::ProcessSupervisor supervisor(pidPath_, "test");
    EXPECT_FALSE(supervisor.isRunning().has_value());

    writePidFile("");
    EXPECT_FALSE(supervisor.isRunning().has_value());
}

TEST_F(ProcessSupervisorTest, NonPositiveOrGarbagePidIsIgnored) {
    sockd::ProcessSupervisor supervisor(pidPath_, "test");
    for (const char* content : {"0\n", "-1\n", "abc\n"}) {
        writePidFile(content);
        EXPECT_FALSE(supervisor.storedPid().has_value()) << content;
    }
}

TEST_F(ProcessSupervisorTest, OwnPidIsRunning) {
    writePidFile(std::to_string(getpid()) + "\n");
    sockd::ProcessSupervisor supervisor(pidPath_, "test");

    auto pid = supervisor.isRunning();
    ASSERT_TRUE(pid.has_value());
    EXPECT_EQ(*pid, getpid());
}

TEST_F(ProcessSupervisorTest, ExitedPidIsNotRunning) {
    pid_t child = fork();
    if (child == 0) _exit(0);
    ASSERT_GT(child, 0);
    int status = 0;
    ASSERT_EQ(waitpid(child, &status, 0), child);

    writePidFile(std::to_string(child) + "\n");
    sockd::ProcessSupervisor supervisor(pidPath_, "test");
    EXPECT_EQ(supervisor.storedPid().value_or(-1), child);
    EXPECT_FALSE(supervisor.isRunning().has_value());
}

TEST_F(ProcessSupervisorTest, StopWhenNotRunningIsIdempotent) {
    sockd::ProcessSupervisor supervisor(pidPath_, "test");
    EXPECT_NO_THROW(supervisor.stop(false));
    EXPECT_NO_THROW(supervisor.stop(false));
    EXPECT_NO_THROW(supervisor.stop(true));
}

TEST_F(ProcessSupervisorTest, StopTerminatesProcessWithSigterm) {
    pid_t child = spawnSleeper(false);
    ASSERT_GT(child, 0);
    Reaper reaper(child);
    writePidFile(std::to_string(child) + "\n");

    sockd::ProcessSupervisor supervisor(pidPath_, "sleeper");
    EXPECT_NO_THROW(supervisor.stop(false));

    int status = reaper.join();
    ASSERT_TRUE(WIFSIGNALED(status));
    EXPECT_EQ(WTERMSIG(status), SIGTERM);

    // Повторная остановка уже остановленного процесса
    EXPECT_NO_THROW(supervisor.stop(false));
}

TEST_F(ProcessSupervisorTest, ForceEscalatesToSigkillAfterCeiling) {
    pid_t child = spawnSleeper(true);
    ASSERT_GT(child, 0);
    Reaper reaper(child);
    writePidFile(std::to_string(child) + "\n");

    sockd::ProcessSupervisor supervisor(pidPath_, "stubborn");
    const auto started = std::chrono::steady_clock::now();
    EXPECT_NO_THROW(supervisor.stop(true));
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_GE(elapsed, supervisor.stopTimeout());
    int status = reaper.join();
    ASSERT_TRUE(WIFSIGNALED(status));
    EXPECT_EQ(WTERMSIG(status), SIGKILL);
}

TEST_F(ProcessSupervisorTest, WithoutForceSurvivorIsStopFailed) {
    pid_t child = spawnSleeper(true);
    ASSERT_GT(child, 0);
    Reaper reaper(child);
    writePidFile(std::to_string(child) + "\n");

    sockd::ProcessSupervisor supervisor(pidPath_, "stubborn");
    supervisor.setStopTimeout(300ms);
    try {
        supervisor.stop(false);
        ADD_FAILURE() << "expected StopFailed";
    } catch (const sockd::ServiceError& e) {
        EXPECT_EQ(e.kind(), sockd::ErrorKind::StopFailed);
    }

    kill(child, SIGKILL);
    reaper.join();
}

TEST(WaitUntilTest, ReturnsAsSoonAsPredicateHolds) {
    int calls = 0;
    EXPECT_TRUE(sockd::waitUntil(1s, 10ms, [&] { return ++calls == 3; }));
    EXPECT_EQ(calls, 3);
}

TEST(WaitUntilTest, GivesUpAfterTimeout) {
    const auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(sockd::waitUntil(200ms, 50ms, [] { return false; }));
    EXPECT_GE(std::chrono::steady_clock::now() - started, 200ms);
}

TEST_F(ProcessSupervisorTest, WritableFileCreatesParentsAndFile) {
    const fs::path nested = dir_ / "run" / "sockd" / "svc.pid";
    const std::string result = sockd::ProcessSupervisor::writableFile(nested.string());

    EXPECT_EQ(result, nested.string());
    ASSERT_TRUE(fs::is_regular_file(nested));

    struct stat st{};
    ASSERT_EQ(stat(nested.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0644u);
    ASSERT_EQ(stat(nested.parent_path().c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0022, 0u);
}

TEST_F(ProcessSupervisorTest, WritableFileRejectsDirectory) {
    try {
        sockd::ProcessSupervisor::writableFile(dir_.string());
        FAIL() << "expected PathPermissionError";
    } catch (const sockd::ServiceError& e) {
        EXPECT_EQ(e.kind(), sockd::ErrorKind::PathPermissionError);
        EXPECT_NE(std::string(e.what()).find(dir_.string()), std::string::npos);
    }
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
