/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-io.hpp
 * @brief Transport-agnostic read/write interface.
 *
 * A gossip node reads inbound envelopes from one Gsn_Io<std::string> and
 * writes outbound envelopes to another. The process uses Gsn_Stdio (line
 * framed stdin/stdout); tests use Gsn_Pipe to wire nodes together in memory.
 *
 * - read() blocks until an item is available and returns std::nullopt at end
 *   of stream; callers stop reading after std::nullopt.
 * - write(T &) must not take ownership, write(T &&) may move from the item.
 * - Thread-safety is up to the implementation and must be documented there.
 */

#ifndef GSN_IO_HPP_
#define GSN_IO_HPP_

#include <optional>
#include <vector>

namespace gsn {

template <typename T> class Gsn_Io {
public:
  virtual ~Gsn_Io() noexcept = default;

  virtual auto read() -> std::optional<T> = 0;

  /**
   * @brief Read up to count items waiting at most timeout microseconds
   *        (0 waits forever). Sources without bulk reads return nothing.
   */
  virtual auto read([[maybe_unused]] size_t count,
                    [[maybe_unused]] long timeout = 0) -> std::vector<T> {
    return {};
  }

  virtual void write(T &item) = 0;
  virtual void write(T &&item) = 0;
};

} // namespace gsn

#endif // GSN_IO_HPP_
