/**
 * @file SignalRouter.hpp
 * @date October 2026
 * @brief Маршрутизация POSIX-сигналов в обработчики через signalfd
 *
 * @details
 * Сигналы, для которых зарегистрирован обработчик, блокируются в
 * вызывающем потоке и читаются из signalfd выделенным потоком. Обработчики
 * вызываются в этом потоке, а не в контексте асинхронного прерывания,
 * поэтому в них допустимы блокировки и журналирование.
 *
 * @warning Регистрацию следует выполнять до создания прочих потоков,
 * иначе они унаследуют маску без блокировки сигнала.
 */

#pragma once

#include <signal.h>

#include <atomic>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace steward {

class SignalRouter {
 public:
  using Handler = std::function<void(int)>;

  static SignalRouter& instance();

  SignalRouter(const SignalRouter&) = delete;
  SignalRouter& operator=(const SignalRouter&) = delete;

  /**
   * @brief Регистрирует обработчик и блокирует сигнал для текущего потока
   * @throw std::invalid_argument Некорректный номер сигнала
   * @throw std::system_error Ошибка pthread_sigmask/signalfd
   */
  void registerHandler(int signum, Handler handler);

  void unregisterHandler(int signum);

  /// Запускает поток чтения signalfd. Повторный вызов игнорируется.
  void start();

  void stop() noexcept;

  bool isRunning() const noexcept { return running_.load(); }

  ~SignalRouter();

 private:
  SignalRouter();
  void dispatchLoop(int epollFd);

  std::unordered_map<int, std::vector<Handler>> handlers_;
  std::mutex handlersMutex_;
  std::atomic<bool> running_{false};
  std::thread worker_;
  int signalFd_ = -1;
  sigset_t originalMask_{};
  sigset_t blockedMask_{};
};

}  // namespace steward
