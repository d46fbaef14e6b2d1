/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-proc.hpp
 * @brief RAII wrapper around a pthread that runs one task.
 *
 * Gsn_Proc owns a pthread and runs a std::function<void()> in it. Behaviour is
 * supplied as a task rather than through subclassing, so the input reader,
 * the timer and the serialized executor of a gossip node are all Gsn_Proc
 * objects with a different closure.
 *
 * Lifetime and cancellation:
 * - The destructor cancels and joins a running thread, so the task must reach
 *   a pthread cancellation point (blocking read(), condition wait, sleep, or
 *   Gsn_Proc::yield()) in a timely manner.
 * - Cancellation is deferred: it only takes effect at cancellation points.
 *
 * The macros below push/pop a pthread cleanup handler that unlocks a
 * pthread_mutex_t if the thread is cancelled while holding it.
 */

#ifndef GSN_PROC_HPP_
#define GSN_PROC_HPP_

#include <pthread.h>

#include <functional>
#include <string>
#include <string_view>

#define GSN_PROC_ENTER_PTHREAD_MUTEX_CLEANUP(mutex)                            \
  pthread_cleanup_push(&gsn::cleanupFuncToUnlockPthreadMutex, (mutex))

#define GSN_PROC_EXIT_PTHREAD_MUTEX_CLEANUP(...) pthread_cleanup_pop(0)

namespace gsn {

/**
 * @brief Cleanup handler for pthread_cleanup_push, unlocks the
 *        pthread_mutex_t pointed to by arg.
 */
void cleanupFuncToUnlockPthreadMutex(void *arg);

class Gsn_Proc {
  using Task = std::function<void()>;

  enum class State { kInvalid, kNew, kReady, kRunning };

public:
  /**
   * @brief Construct a Gsn_Proc.
   *
   * @param name Name used in diagnostics.
   * @param fnc  Optional task run by exec().
   */
  explicit Gsn_Proc(std::string_view name, const Gsn_Proc::Task &fnc = {});
  virtual ~Gsn_Proc() noexcept;

  Gsn_Proc(const Gsn_Proc &obj) = delete;
  const Gsn_Proc &operator=(const Gsn_Proc &obj) = delete;
  Gsn_Proc(Gsn_Proc &&obj) = delete;
  Gsn_Proc &operator=(Gsn_Proc &&obj) = delete;

  /**
   * @brief Start a thread running fnc, or the task set at construction if
   *        fnc is empty.
   *
   * @return true if the thread was created.
   */
  auto exec(const Gsn_Proc::Task &fnc = {}) -> bool;

  /**
   * @brief Join the running thread.
   *
   * @return true if the join succeeded.
   * @throws std::runtime_error if no thread is running or the join fails.
   */
  auto wait() -> bool;

  auto getName() const -> const std::string &;

  /**
   * @brief Cancellation point plus sched_yield(). Long running loops in a
   *        task call this so that the owning Gsn_Proc can stop them.
   */
  static void yield();

protected:
  auto getState() const -> Gsn_Proc::State;
  auto setState(Gsn_Proc::State state) -> Gsn_Proc::State;
  void setTask(Gsn_Proc::Task fnc);

  auto runExec() -> bool;
  auto stopExec() -> bool;

private:
  static auto runFnInThreadHelper(void *context) -> void *;

  const std::string m_name{};

  Gsn_Proc::Task m_fnc{};
  Gsn_Proc::State m_state{};
  pthread_t m_th{};
}; // class Gsn_Proc

} // namespace gsn

#endif // GSN_PROC_HPP_
