/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-async.hpp
 * @brief Gsn_Async: serialized asynchronous execution of tasks.
 *
 * Gsn_Async is a Gsn_Pipe of std::function<void()> with one consumer thread.
 * Every task submitted through addExecTask() runs on that thread, in
 * submission order, one at a time. A class that inherits from Gsn_Async and
 * only touches its state from submitted tasks needs no mutex: this is how a
 * gossip node serializes inbound messages and timer ticks over its store,
 * topology and pending-ack table.
 *
 * Callers that need the result of a task use addExecTaskWithWait(); the
 * returned Gsn_Async_Wait::wait() blocks until the task ran and rethrows an
 * exception it threw. A task must never wait on its own Gsn_Async.
 */

#ifndef GSN_ASYNC_HPP_
#define GSN_ASYNC_HPP_

#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>

#include "gsn-pipe.hpp"

// Submit block as a task of this object, capturing as named.
#define GSN_ASYNC_CALL_WITH_COPY_CAPTURE(block)                                \
  do {                                                                         \
    this->addExecTask([=]() mutable -> void { block; });                       \
  } while (false)

#define GSN_ASYNC_CALL_WITH_CAPTURE(block, ...)                                \
  do {                                                                         \
    this->addExecTask([__VA_ARGS__]() mutable -> void { block; });             \
  } while (false)

namespace gsn {

class Gsn_Async : public Gsn_Pipe<std::function<void()>> {
public:
  class Gsn_Async_Wait {
    friend class Gsn_Async;

  public:
    void wait();

  private:
    std::mutex m_mutex{};
    std::condition_variable m_cond_var{};

    bool m_done{};
    std::exception_ptr m_thrown_exception{};
  };

  explicit Gsn_Async(std::string_view name = "");
  virtual ~Gsn_Async() noexcept;

  Gsn_Async(const Gsn_Async &obj) = delete;
  const Gsn_Async &operator=(const Gsn_Async &obj) = delete;
  Gsn_Async(Gsn_Async &&obj) = delete;
  Gsn_Async &operator=(Gsn_Async &&obj) = delete;

  void addExecTask(std::function<void()> fnc);

  auto addExecTaskWithWait(std::function<void()> fnc)
      -> std::shared_ptr<Gsn_Async_Wait>;

  /**
   * @brief Return and clear the exception thrown by the last failing task
   *        submitted through addExecTask(), if any.
   */
  auto takeThrownException() -> std::exception_ptr;

private:
  using Gsn_Pipe::read;
  using Gsn_Pipe::readAndProcess;
  using Gsn_Pipe::write;

  std::mutex m_exception_mutex{};
  std::exception_ptr m_thrown_exception{};
}; // class Gsn_Async

} // namespace gsn

#endif // GSN_ASYNC_HPP_
