/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-async.cpp
 * @brief The source implementation file for gsn-async.
 */

#include "gsn-async.hpp"

#include <cxxabi.h>

#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>
#include <utility>

#include "gsn-debug.hpp"
#include "gsn-pipe.hpp"
#include "gsn-proc.hpp"

namespace gsn {

void Gsn_Async::Gsn_Async_Wait::wait() {
  std::unique_lock<std::mutex> lock(m_mutex);
  m_cond_var.wait(lock, [this]() -> bool { return m_done; });

  if (m_thrown_exception) {
    std::rethrow_exception(m_thrown_exception);
  }
}

Gsn_Async::Gsn_Async(std::string_view name)
    : Gsn_Pipe{name, [](std::function<void()> &&task) -> void {
                 std::move(task)();
                 Gsn_Proc::yield();
               }} {}

Gsn_Async::~Gsn_Async() noexcept try { this->waitForEmpty(); } catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

void Gsn_Async::addExecTask(std::function<void()> fnc) {
  this->write([this, fnc = std::move(fnc)]() -> void {
    try {
      fnc();
    } catch (abi::__forced_unwind &) {
      // thread cancellation must keep unwinding
      throw;
    } catch (const std::exception &e) {
      GSN_DEBUG_PRINT(std::cerr << getName() << ": task failed: " << e.what()
                                << "\n");

      const std::lock_guard<std::mutex> lock(m_exception_mutex);
      m_thrown_exception = std::current_exception();
    } catch (...) {
      const std::lock_guard<std::mutex> lock(m_exception_mutex);
      m_thrown_exception = std::current_exception();
    }
  });
}

auto Gsn_Async::addExecTaskWithWait(std::function<void()> fnc)
    -> std::shared_ptr<Gsn_Async::Gsn_Async_Wait> {
  auto wait_shared_ptr = std::make_shared<Gsn_Async_Wait>();

  this->write([wait_shared_ptr, fnc = std::move(fnc)]() -> void {
    try {
      fnc();
    } catch (abi::__forced_unwind &) {
      throw;
    } catch (...) {
      wait_shared_ptr->m_thrown_exception = std::current_exception();
    }

    const std::unique_lock<std::mutex> lock(wait_shared_ptr->m_mutex);
    wait_shared_ptr->m_done = true;
    wait_shared_ptr->m_cond_var.notify_all();
  });

  return wait_shared_ptr;
}

auto Gsn_Async::takeThrownException() -> std::exception_ptr {
  const std::lock_guard<std::mutex> lock(m_exception_mutex);

  return std::exchange(m_thrown_exception, nullptr);
}

} // namespace gsn
