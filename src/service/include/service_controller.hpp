/**
 * @file service_controller.hpp
 * @brief Управление жизненным циклом сервиса с управляющим сокетом
 *
 * @details
 * ServiceController объединяет демонизацию (DaemonManager), контроль
 * экземпляра по PID-файлу (ProcessSupervisor), сброс привилегий, маршрутизацию
 * сигналов (SignalRouter) и обслуживание управляющего сокета
 * (SocketTransport). Соединения обслуживаются строго по одному в потоке,
 * вызвавшем start(), поэтому обработчик запросов может без блокировок
 * работать с состоянием процесса.
 *
 * @note Не потокобезопасен
 * @warning start() в обслуживающем процессе не возвращает управление:
 * процесс завершается с кодом 130 после onTeardown
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "../include/lifecycle_hooks.hpp"
#include "sockd/Connection.hpp"
#include "sockd/ProcessSupervisor.hpp"
#include "sockd/ServiceConfig.hpp"

/**
 * @defgroup Core Основные компоненты сервиса
 */

/**
 * @defgroup MainAPI Основные методы
 */

/**
 * @defgroup SignalHandlers Методы обработки системных сигналов
 */

namespace sockd {

class DaemonManager;
class ServerSocket;
class SignalRouter;

/**
 * @class ServiceController
 * @brief Запуск, остановка и обращение к экземпляру сервиса
 * @ingroup Core
 *
 * @details
 * Этапы start() в режиме демона:
 * 1. Проверка PID-файла: живой процесс - ServiceError(AlreadyRunning)
 * 2. Проверка доступности PID- и лог-файла
 * 3. Double-fork; исходный процесс ждет PID-файл и ответ "pong"
 *    (предел startTimeout, иначе ServiceError(StartTimeout))
 * 4. Отсоединенный процесс: сброс привилегий, onSetup, сигналы, сокет,
 *    цикл обслуживания
 *
 * В режиме foreground этапы 1-3 пропускаются.
 *
 * @code
 ServiceConfig config;
 config.useUnixSocket("/tmp/listd.sock");
 config.pidPath = "/tmp/listd.pid";

 ServiceController listd("listd", config);
 listd.setOnHandle([](const std::string& raw, Connection&) {
     return std::optional<std::string>("ok");
 });
 return listd.run({argv + 1, argv + argc});
 @endcode
 */
class ServiceController {
 public:
  ServiceController(std::string name, ServiceConfig config,
                    LifecycleHooks hooks = {});

  ServiceController(const ServiceController &) = delete;
  ServiceController &operator=(const ServiceController &) = delete;

  const ServiceIdentity &identity() const { return identity_; }
  const std::string &name() const { return identity_.name(); }

  const ServiceConfig &config() const { return config_; }
  ServiceConfig &config() { return config_; }

  /// PID-файл из конфигурации или /var/run/<safeName>.pid
  std::string pidPath() const;

  ServiceController &setOnSetup(LifecycleHooks::SetupHook hook);
  ServiceController &setOnTeardown(LifecycleHooks::TeardownHook hook);
  ServiceController &setOnHandle(LifecycleHooks::HandleHook hook);

  /// Вызывает onSetup, если он установлен
  void runSetup();

  /// Вызывает onTeardown, если он установлен
  void runTeardown();

  /**
   * @brief Передать запрос обработчику
   * @throw std::logic_error если onHandle не установлен
   */
  std::optional<std::string> runHandle(const std::string &message,
                                       Connection &connection);

  /**
   * @brief Запустить сервис
   * @ingroup MainAPI
   *
   * @details В исходном процессе возвращает управление после подтверждения
   * запуска демона. В обслуживающем процессе не возвращает управление.
   *
   * @throw ServiceError(AlreadyRunning, StartTimeout, PathPermissionError,
   * PrivilegeError, SocketInUse, TransportPermissionError)
   * @throw std::logic_error если onHandle не установлен
   */
  void start();

  /**
   * @brief Остановить работающий экземпляр
   * @ingroup MainAPI
   * @throw ServiceError(StopFailed) если процесс пережил эскалацию
   */
  void stop();

  /// stop(), затем start()
  void restart();

  /**
   * @brief Отправить сообщение работающему экземпляру
   * @ingroup MainAPI
   *
   * @return Ответ без терминатора строки
   * @throw ServiceError(NotRunning) соединение не установлено и PID-файл не
   * указывает на живой процесс
   * @throw ServiceError(ConnectionError) прочие ошибки соединения, включая
   * отсутствие ответа за timeout
   * @throw ServiceError(TransportPermissionError) нет прав на сокет
   */
  std::string send(const std::string &message);
  std::string send(const std::string &message,
                   std::chrono::milliseconds timeout);

  /**
   * @brief Выполнить команду, заданную словами командной строки
   * @ingroup MainAPI
   *
   * @details
   *  - пусто: start() без демонизации
   *  - start | stop | restart: соответствующая операция
   *  - send <слова...>: send() и печать ответа в stdout
   *  - иное: send() всех слов
   *
   * @return EXIT_SUCCESS или EXIT_FAILURE; ServiceError записывается в лог
   */
  int run(const std::vector<std::string> &words);

 private:
  ProcessSupervisor makeSupervisor() const;
  void initLogger();

  void startDaemon();
  void confirmStart(const ProcessSupervisor &supervisor);
  bool answersPing(std::chrono::milliseconds timeout) const;

  /**
   * @brief Обслуживание сокета до сигнала завершения
   * @ingroup SignalHandlers
   *
   * @details Сигналы INT, QUIT и TERM читаются через signalfd в том же
   * цикле poll(), что и слушающий сокет. После выхода из цикла сокет
   * закрывается, вызывается onTeardown и процесс завершается с кодом 130.
   */
  [[noreturn]] void serve(DaemonManager *daemon);
  void acceptLoop(ServerSocket &server, SignalRouter &router);
  void serveConnection(Connection &connection, SignalRouter &router);

  /// Ожидание данных запроса с одновременной обработкой сигналов
  bool waitForRequest(Connection &connection, SignalRouter &router);

  ServiceIdentity identity_;
  ServiceConfig config_;
  LifecycleHooks hooks_;

  /// Номер сигнала, запросившего завершение; 0 - работа продолжается
  int shutdownSignal_ = 0;
};

}  // namespace sockd
