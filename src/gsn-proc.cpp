/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-proc.cpp
 * @brief Implementation of Gsn_Proc, the pthread RAII wrapper.
 */

#include "gsn-proc.hpp"

#include <pthread.h>
#include <sched.h>

#include <cerrno>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace gsn {

void cleanupFuncToUnlockPthreadMutex(void *arg) {
  auto *mutex = static_cast<pthread_mutex_t *>(arg);

  pthread_mutex_unlock(mutex);
}

Gsn_Proc::Gsn_Proc(std::string_view name, const Gsn_Proc::Task &fnc)
    : m_name{name} {
  setState(State::kNew);

  if (fnc) {
    setTask(fnc);
  }
}

Gsn_Proc::~Gsn_Proc() noexcept try {
  if (getState() == State::kRunning) {
    stopExec();
  }

  setState(State::kInvalid);
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

auto Gsn_Proc::exec(const Gsn_Proc::Task &fnc) -> bool {
  if (fnc) {
    setTask(fnc);
  }

  return runExec();
}

auto Gsn_Proc::getName() const -> const std::string & { return m_name; }

auto Gsn_Proc::getState() const -> Gsn_Proc::State { return m_state; }

auto Gsn_Proc::setState(State state) -> Gsn_Proc::State {
  const State old_state = this->m_state;

  this->m_state = state;

  return old_state;
}

/**
 * @brief Assign the task run by the thread. The Gsn_Proc must not be
 *        running.
 *
 * @throws std::runtime_error if a thread is running.
 */
void Gsn_Proc::setTask(Gsn_Proc::Task fnc) {
  if (getState() != State::kNew && getState() != State::kReady) {
    throw std::runtime_error("Gsn_Proc (" + m_name +
                             ") can not change task while running");
  }

  this->m_fnc = std::move(fnc);
  setState(State::kReady);
}

auto Gsn_Proc::wait() -> bool {
  int err{};
  void *ret{};

  if (getState() != State::kRunning) {
    throw std::runtime_error("No task is exec in Gsn_Proc (" + m_name + ")");
  }

  err = pthread_join(m_th, &ret);
  if (0 != err) {
    throw std::runtime_error(std::system_category().message(err));
  }

  setState(State::kReady);

  return 0 == err;
}

void Gsn_Proc::yield() {
  pthread_testcancel();

  sched_yield();
}

auto Gsn_Proc::stopExec() -> bool {
  int err{};

  if (getState() != State::kRunning) {
    return true;
  }

  // ESRCH: the task returned already and the thread only awaits the join
  err = pthread_cancel(m_th);
  if (0 != err && ESRCH != err) {
    throw std::runtime_error(std::system_category().message(err));
  }

  return wait();
}

auto Gsn_Proc::runExec() -> bool {
  int err{};
  State old_state{};

  if (getState() != State::kReady) {
    throw std::runtime_error("No task is assigned to the Gsn_Proc (" + m_name +
                             ")");
  }

  old_state = setState(State::kRunning);
  err = pthread_create(&m_th, nullptr, &(Gsn_Proc::runFnInThreadHelper), this);
  if (0 != err) {
    setState(old_state);

    return false;
  }

  return true;
}

auto Gsn_Proc::runFnInThreadHelper(void *context) -> void * {
  int old_state{};

  // deferred cancellation, the task is only cancelled at cancellation points
  pthread_setcancelstate(PTHREAD_CANCEL_ENABLE, &old_state);
  pthread_setcanceltype(PTHREAD_CANCEL_DEFERRED, &old_state);

  auto *proc = static_cast<Gsn_Proc *>(context);
  proc->m_fnc();

  return nullptr;
}

} // namespace gsn
