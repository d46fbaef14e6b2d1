/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-timer.hpp
 * @brief Recurring timer running a callback every fixed interval.
 *
 * Gsn_Timer<T> (T a std::chrono::duration) sleeps for the interval and then
 * calls the callback, forever, on its own Gsn_Proc thread. The callback is
 * never run before the interval elapsed but may run later than that. A
 * gossip node uses it only to post a tick task into its serialized context,
 * so the callback itself stays short.
 *
 * std::exception thrown by the callback is reported with GSN_DEBUG_PRINT and
 * the timer keeps running.
 */

#ifndef GSN_TIMER_HPP_
#define GSN_TIMER_HPP_

#include <chrono>
#include <functional>
#include <thread>

#include "gsn-debug.hpp"
#include "gsn-proc.hpp"

namespace gsn {

template <typename T> class Gsn_Timer : public Gsn_Proc {
public:
  Gsn_Timer(const T &reltime, std::function<void()> fn);
  virtual ~Gsn_Timer() noexcept;

  Gsn_Timer(const Gsn_Timer &obj) = delete;
  const Gsn_Timer &operator=(const Gsn_Timer &obj) = delete;
  Gsn_Timer(Gsn_Timer &&obj) = delete;
  Gsn_Timer &operator=(Gsn_Timer &&obj) = delete;

  /**
   * @brief Stop the running timer and start it again with a new interval.
   *        An empty fn keeps the current callback.
   */
  void start(const T &reltime, std::function<void()> fn = {});

  void stop();

private:
  std::function<void()> m_fn{};
  T m_reltime{};
}; // class Gsn_Timer

template <typename T>
Gsn_Timer<T>::Gsn_Timer(const T &reltime, std::function<void()> fn)
    : Gsn_Proc{"timer"}, m_fn{std::move(fn)}, m_reltime{reltime} {
  this->start(this->m_reltime);
}

template <typename T> Gsn_Timer<T>::~Gsn_Timer() noexcept try {
  this->stop();
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

template <typename T>
void Gsn_Timer<T>::start(const T &reltime, std::function<void()> fn) {
  this->stop();

  m_reltime = reltime;

  if (fn) {
    m_fn = std::move(fn);
  }

  this->exec([this]() {
    while (true) {
      std::this_thread::sleep_for(this->m_reltime);
      Gsn_Proc::yield();

      try {
        if (m_fn) {
          this->m_fn();
        }
      } catch (const std::exception &e) {
        GSN_DEBUG_PRINT(std::cerr << getName() << ": " << e.what() << "\n");
      }
    }
  });
}

template <typename T> void Gsn_Timer<T>::stop() { this->stopExec(); }

} // namespace gsn

#endif // GSN_TIMER_HPP_
