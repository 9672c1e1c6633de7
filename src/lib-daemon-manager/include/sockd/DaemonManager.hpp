/**
 * @file DaemonManager.hpp
 * @brief Отсоединение процесса от терминала и состояние демона
 *
 * @details DaemonManager является единственным контекстом процесса,
 * создаваемым в момент демонизации: он владеет путями PID- и лог-файла,
 * перенаправлением стандартных потоков и остаточными реакциями на сигналы.
 * Демонизация выполняется не более одного раза за жизнь процесса.
 */

#pragma once

#include <atomic>
#include <filesystem>
#include <optional>
#include <string>

namespace sockd {

/**
 * @class DaemonManager
 * @brief Double-fork демонизация с возвратом управления исходному процессу
 *
 * @details В отличие от классической схемы, исходный процесс не завершается:
 * detach() возвращает ему Role::Parent, чтобы вызывающий код мог дождаться
 * подтверждения запуска. Отсоединенный процесс получает Role::Child.
 *
 * @note Последовательность в дочернем процессе:
 * 1. setsid() - новая сессия
 * 2. Второй fork() - процесс не может снова получить управляющий терминал
 * 3. umask(0)
 * 4. chdir("/")
 * 5. Запись PID-файла
 * 6. Перенаправление stdin/stdout/stderr
 * 7. SIGHUP игнорируется, SIGUSR1 блокируется до подключения SignalRouter
 *
 * @warning Пути должны быть доступны для записи до вызова detach();
 * используйте ProcessSupervisor::writableFile().
 */
class DaemonManager {
public:
    enum class Role { Parent, Child };

    /**
     * @param pidPath Путь к PID-файлу (относительный путь разрешается сразу)
     * @param logPath Лог-файл для stdout/stderr; без него используется /dev/null
     */
    DaemonManager(std::optional<std::string> pidPath, std::optional<std::string> logPath);

    DaemonManager(const DaemonManager&) = delete;
    DaemonManager& operator=(const DaemonManager&) = delete;

    /**
     * @brief Демонизирует текущий процесс
     * @throw std::system_error при ошибках fork/setsid/chdir/записи PID
     * @throw std::logic_error при повторной демонизации процесса
     *
     * @note Исключение после первого fork() возникает только в дочернем
     * процессе; проверяйте inChild() в обработчике.
     */
    Role detach();

    /**
     * @brief Записывает PID текущего процесса (права 0644)
     * @throw std::system_error при ошибках открытия или записи
     */
    void writePid();

    /**
     * @brief stdin из /dev/null, stdout в лог-файл (append), stderr в stdout
     * @throw std::system_error если файлы не открываются
     */
    void redirectStreams();

    /**
     * @brief Повторно открыть лог-файл после внешней ротации (SIGUSR1)
     */
    void reopenStreams() { redirectStreams(); }

    bool inChild() const noexcept { return mInChild; }

    const std::optional<std::filesystem::path>& pidPath() const { return mPidPath; }
    const std::optional<std::filesystem::path>& logPath() const { return mLogPath; }

    /// true, если процесс уже был демонизирован
    static bool processDetached() noexcept { return sDetached.load(); }

private:
    std::optional<std::filesystem::path> mPidPath;
    std::optional<std::filesystem::path> mLogPath;
    bool mInChild = false;

    static inline std::atomic<bool> sDetached{false};
};

} // namespace sockd
