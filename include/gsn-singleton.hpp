/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-singleton.hpp
 * @brief Helper base class for process wide singletons.
 *
 * A class T derives from Gsn_Singleton<T> and is created (once) and
 * retrieved with T::createInstance(args...):
 *
 * ```
 * class Gsn_Runtime_Manager : public gsn::Gsn_Singleton<Gsn_Runtime_Manager> {
 * public:
 *   static void runPriorToCreateInstance();
 *   ...
 * };
 *
 * auto inst = gsn::Gsn_Runtime_Manager::createInstance();
 * ```
 *
 * - The first call constructs T from its arguments, later calls ignore their
 *   arguments and return the same std::shared_ptr<T>.
 * - If T has a public "static void runPriorToCreateInstance()", it runs once
 *   right before T is constructed. Gsn_Runtime_Manager masks signals there,
 *   before its own thread starts.
 */

#ifndef GSN_SINGLETON_HPP_
#define GSN_SINGLETON_HPP_

#include <atomic>
#include <concepts>
#include <memory>
#include <mutex>
#include <utility>

namespace gsn {

template <typename T>
concept HasStaticRunPriorToCreateInstance = requires {
  { T::runPriorToCreateInstance() } -> std::same_as<void>;
};

template <typename T> class Gsn_Singleton {
public:
  template <class... U> static std::shared_ptr<T> createInstance(U &&...arg);

private:
  static std::atomic<bool> s_allocated;
  static std::shared_ptr<T> s_instance;
  static std::once_flag s_init_once;
};

template <typename T> std::atomic<bool> Gsn_Singleton<T>::s_allocated{false};

template <typename T> std::once_flag Gsn_Singleton<T>::s_init_once{};

template <typename T> std::shared_ptr<T> Gsn_Singleton<T>::s_instance{};

template <typename T>
template <class... U>
std::shared_ptr<T> Gsn_Singleton<T>::createInstance(U &&...arg) {
  if (!s_allocated.load()) {
    std::call_once(
        s_init_once,
        [](U &&...arg) {
          if constexpr (HasStaticRunPriorToCreateInstance<T>) {
            T::runPriorToCreateInstance();
          }

          s_instance = std::make_shared<T>(std::forward<U>(arg)...);
          s_allocated.store(true);
        },
        std::forward<U>(arg)...);
  }

  return s_instance;
}

} // namespace gsn

#endif // GSN_SINGLETON_HPP_
