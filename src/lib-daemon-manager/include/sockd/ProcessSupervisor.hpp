/**
 * @file ProcessSupervisor.hpp
 * @brief Отслеживание живости процесса по PID-файлу и его остановка
 *
 * @details PID-файл читается без межпроцессной блокировки: решение
 * принимается по результату kill(pid, 0) непосредственно перед действием.
 */

#pragma once

#include <sys/types.h>

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace sockd {

/**
 * @brief Опрашивать predicate с интервалом interval, пока он не вернет true
 * или не истечет timeout
 * @return true если условие выполнилось до истечения timeout
 */
bool waitUntil(std::chrono::milliseconds timeout,
               std::chrono::milliseconds interval,
               const std::function<bool()>& predicate);

/**
 * @class ProcessSupervisor
 * @brief Проверка и эскалирующая остановка экземпляра сервиса
 *
 * @note Последовательность stop():
 * 1. SIGTERM и ожидание завершения (шаг 100 мс, предел stopTimeout)
 * 2. SIGKILL, если процесс жив и разрешен force
 * 3. ServiceError(StopFailed), если процесс все еще жив
 */
class ProcessSupervisor {
 public:
  static constexpr std::chrono::milliseconds kPollInterval{100};

  /**
   * @param pidPath Путь к PID-файлу; без него сервис всегда считается
   *                остановленным
   * @param name    Имя сервиса для сообщений
   */
  ProcessSupervisor(std::optional<std::string> pidPath, std::string name);

  /**
   * @brief PID из файла; пусто, если файл отсутствует, пуст или не содержит
   * положительного числа
   */
  std::optional<pid_t> storedPid() const;

  /**
   * @brief PID работающего экземпляра или пусто
   *
   * @details Только ESRCH от kill(pid, 0) означает отсутствие процесса;
   * успех и любая другая ошибка (например, EPERM) считаются живым процессом.
   */
  std::optional<pid_t> isRunning() const;

  /**
   * @brief Остановить экземпляр; повторный вызов для остановленного сервиса
   * только пишет предупреждение
   * @throw ServiceError(StopFailed) если процесс пережил эскалацию
   */
  void stop(bool force) const;

  void setStopTimeout(std::chrono::milliseconds timeout) { stopTimeout_ = timeout; }
  std::chrono::milliseconds stopTimeout() const { return stopTimeout_; }

  const std::optional<std::string>& pidPath() const { return pidPath_; }

  /**
   * @brief Проверка существования процесса сигналом 0
   */
  static bool isAlive(pid_t pid) noexcept;

  /**
   * @brief Гарантирует существование доступного для записи файла
   *
   * @details Создает недостающие каталоги (0755), сам файл и выставляет
   * права 0644.
   *
   * @return Абсолютный путь к файлу
   * @throw ServiceError(PathPermissionError) если файл не удалось сделать
   * доступным для записи
   */
  static std::string writableFile(const std::string& path);

 private:
  std::optional<std::string> pidPath_;
  std::string name_;
  std::chrono::milliseconds stopTimeout_{2000};
};

}  // namespace sockd
