/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-runtime.cpp
 * @brief Implementation of Gsn_Runtime_Manager.
 *
 * - runPriorToCreateInstance(): blocks SIGINT, SIGTERM, SIGQUIT and SIGHUP in
 *   the creating thread, before the manager's own Gsn_Async thread exists.
 * - enterMainLoop(): starts the thread that sigwait()s for the blocked
 *   signals and posts each one to the Gsn_Async context, then waits on the
 *   exit flag. On return the signal thread is cancelled and joined.
 * - exitMainLoop(): sets the exit flag and wakes up enterMainLoop().
 */

#include "gsn-runtime.hpp"

#include <pthread.h>
#include <signal.h>

#include <atomic>
#include <cstring>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include "gsn-async.hpp"
#include "gsn-debug.hpp"
#include "gsn-proc.hpp"

namespace gsn {

sigset_t Gsn_Runtime_Manager::s_mask{};

Gsn_Runtime_Manager::Gsn_Runtime_Manager()
    : Gsn_Async{"Gsn_Runtime_Manager"}, m_mask{Gsn_Runtime_Manager::s_mask} {
  m_signal_handlers[SIGTERM] = [this]([[maybe_unused]] int signo) -> void {
    this->exitMainLoop();
  };

  m_signal_handlers[SIGINT] = [this]([[maybe_unused]] int signo) -> void {
    this->exitMainLoop();
  };
}

Gsn_Runtime_Manager::~Gsn_Runtime_Manager() noexcept try {
  exitMainLoop();

  m_signal_wait_proc = {};
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

void Gsn_Runtime_Manager::runPriorToCreateInstance() {
  sigset_t old_mask{};
  int err{};

  sigemptyset(&Gsn_Runtime_Manager::s_mask);
  sigaddset(&Gsn_Runtime_Manager::s_mask, SIGINT);
  sigaddset(&Gsn_Runtime_Manager::s_mask, SIGTERM);
  sigaddset(&Gsn_Runtime_Manager::s_mask, SIGQUIT);
  sigaddset(&Gsn_Runtime_Manager::s_mask, SIGHUP);

  err = pthread_sigmask(SIG_BLOCK, &Gsn_Runtime_Manager::s_mask, &old_mask);
  if (0 != err) {
    throw std::runtime_error("Error in pthread_sigmask: " +
                             std::system_category().message(err));
  }
}

void Gsn_Runtime_Manager::enterMainLoop() {
  if (m_enter_atomic_flag.test_and_set(std::memory_order_acquire)) {
    throw std::runtime_error("Error: enter main loop twice");
  }

  m_signal_wait_proc = std::make_unique<Gsn_Proc>(
      "Gsn_Runtime_Manager_SignalWait", [this]() -> void {
        while (true) {
          int signo{};

          // sigwait() is a cancellation point
          int err = sigwait(&m_mask, &signo);
          if (0 != err) {
            GSN_DEBUG_PRINT(std::cerr << "Error in sigwait: "
                                      << std::system_category().message(err)
                                      << "\n");

            this->exitMainLoop();

            break;
          }

          this->addExecTask(
              [this, signo]() { this->execSignalHandlerInternal(signo); });
        }
      });

  if (!m_signal_wait_proc->exec()) {
    throw std::runtime_error(
        "Failed to start Gsn_Runtime_Manager_SignalWait task");
  }

  while (!m_exit_atomic_flag.test(std::memory_order_acquire)) {
    m_exit_atomic_flag.wait(false, std::memory_order_acquire);
  }

  m_signal_wait_proc = {};
}

void Gsn_Runtime_Manager::exitMainLoop() {
  if (!m_exit_atomic_flag.test_and_set(std::memory_order_release)) {
    m_exit_atomic_flag.notify_all();
  }
}

void Gsn_Runtime_Manager::registerSignalHandler(int signo,
                                                SignalHandler handler) {
  this->addExecTask([this, signo, handler = std::move(handler)]() mutable {
    m_ext_signal_handlers[signo].push_back(std::move(handler));
  });
}

/**
 * @brief Run the handlers of signo, in the Gsn_Async context.
 */
void Gsn_Runtime_Manager::execSignalHandlerInternal(int signo) {
  GSN_DEBUG_PRINT(std::cerr << "received signal " << signo << " ("
                            << strsignal(signo) << ")\n");

  auto ext_handlers = m_ext_signal_handlers.find(signo);
  if (m_ext_signal_handlers.end() != ext_handlers) {
    for (auto &fnc : ext_handlers->second) {
      fnc(signo);
    }
  }

  auto handler = m_signal_handlers.find(signo);
  if (m_signal_handlers.end() != handler) {
    handler->second(signo);
  }
}

} // namespace gsn
