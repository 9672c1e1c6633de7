/**
 * @file SignalRouter.hpp
 * @brief Маршрутизатор POSIX-сигналов для однопоточного цикла обслуживания
 *
 * @details Сигналы блокируются и доставляются через signalfd. Дескриптор
 * опрашивается тем же poll(), что и слушающий сокет, поэтому обработчики
 * выполняются в потоке цикла, а не в асинхронном контексте сигнала.
 */
#pragma once

#include <signal.h>

#include <chrono>
#include <functional>
#include <map>
#include <vector>

namespace sockd {

/**
 * @class SignalRouter
 * @brief Регистрация обработчиков и синхронная диспетчеризация сигналов
 *
 * @note Основные возможности:
 * - Несколько обработчиков на один сигнал, вызываются в порядке регистрации
 * - Восстановление исходной маски сигналов в деструкторе
 *
 * @warning
 * - Только для Linux
 * - SIGKILL и SIGSTOP не поддерживаются
 * - Маска меняется для вызывающего потока; создавайте роутер до запуска
 *   других потоков
 */
class SignalRouter {
 public:
  using Handler = std::function<void(int)>;

  /**
   * @throw std::system_error если signalfd не создан
   */
  SignalRouter();
  ~SignalRouter();

  SignalRouter(const SignalRouter&) = delete;
  SignalRouter& operator=(const SignalRouter&) = delete;

  /**
   * @brief Зарегистрировать обработчик для сигнала
   * @throw std::invalid_argument при неверном номере, SIGKILL или SIGSTOP
   * @throw std::system_error при ошибке обновления маски signalfd
   *
   * @code
   * router.registerHandler(SIGTERM, [&](int) { shutdown = true; });
   * @endcode
   */
  void registerHandler(int signum, Handler handler);

  /**
   * @brief Удалить обработчики сигнала; сигнал остается заблокированным
   */
  void unregisterHandler(int signum);

  /// Дескриптор для poll(): готов к чтению при наличии сигнала
  int fd() const noexcept { return signal_fd_; }

  /**
   * @brief Прочитать все ожидающие сигналы и вызвать обработчики
   * @return количество обработанных сигналов
   */
  int dispatch();

  /**
   * @brief Дождаться сигнала не дольше timeout и обработать его
   * @return true если был обработан хотя бы один сигнал
   */
  bool waitAndDispatch(std::chrono::milliseconds timeout);

 private:
  std::map<int, std::vector<Handler>> handlers_;
  int signal_fd_ = -1;
  sigset_t original_mask_;
  sigset_t blocked_mask_;
};

}  // namespace sockd
