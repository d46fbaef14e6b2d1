/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-runtime.hpp
 * @brief Gsn_Runtime_Manager: process main loop and POSIX signal handling.
 *
 * The singleton blocks SIGINT, SIGTERM, SIGQUIT and SIGHUP in the calling
 * thread before it is constructed, so every thread created afterwards
 * inherits the mask and the signals are only received by its own sigwait()
 * thread. Handlers run in the manager's Gsn_Async context: externally
 * registered ones first, then the default one. By default SIGINT and SIGTERM
 * exit the main loop.
 *
 * The manager must therefore be created before any other thread, i.e. first
 * thing in main():
 *
 * ```
 * auto inst = gsn::Gsn_Runtime_Manager::createInstance();
 * ...
 * inst->enterMainLoop(); // returns after exitMainLoop()
 * ```
 */

#ifndef GSN_RUNTIME_HPP_
#define GSN_RUNTIME_HPP_

#include <signal.h>

#include <atomic>
#include <functional>
#include <memory>
#include <unordered_map>
#include <vector>

#include "gsn-async.hpp"
#include "gsn-proc.hpp"
#include "gsn-singleton.hpp"

namespace gsn {

class Gsn_Runtime_Manager : public Gsn_Singleton<Gsn_Runtime_Manager>,
                            private Gsn_Async {
  using SignalHandler = std::function<void(int signo)>;

public:
  Gsn_Runtime_Manager();
  virtual ~Gsn_Runtime_Manager() noexcept;

  Gsn_Runtime_Manager(const Gsn_Runtime_Manager &obj) = delete;
  const Gsn_Runtime_Manager &operator=(const Gsn_Runtime_Manager &obj) = delete;
  Gsn_Runtime_Manager(Gsn_Runtime_Manager &&obj) = delete;
  Gsn_Runtime_Manager &operator=(Gsn_Runtime_Manager &&obj) = delete;

  /**
   * @brief Block the calling thread until exitMainLoop() is called.
   *
   * @throws std::runtime_error if the main loop is already entered or the
   *         signal thread can not be started.
   */
  void enterMainLoop();

  /**
   * @brief Make enterMainLoop() return. Safe from any thread, including a
   *        signal handler, and idempotent.
   */
  void exitMainLoop();

  /**
   * @brief Add a handler for signo, run before the default handler.
   */
  void registerSignalHandler(int signo, SignalHandler handler);

  static void runPriorToCreateInstance();

private:
  void execSignalHandlerInternal(int signo);

  std::unique_ptr<Gsn_Proc> m_signal_wait_proc{};
  sigset_t m_mask{};

  std::unordered_map<int, SignalHandler> m_signal_handlers{};
  std::unordered_map<int, std::vector<SignalHandler>> m_ext_signal_handlers{};

  std::atomic_flag m_enter_atomic_flag{};
  std::atomic_flag m_exit_atomic_flag{};

  static sigset_t s_mask;
}; // class Gsn_Runtime_Manager

} // namespace gsn

#endif // GSN_RUNTIME_HPP_
