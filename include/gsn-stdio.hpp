/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-stdio.hpp
 * @brief Line framed Gsn_Io<std::string> over a pair of file descriptors.
 *
 * Gsn_Stdio is the process transport of a gossip node: the harness writes one
 * JSON envelope per line to the node's stdin and reads one per line from its
 * stdout. Any pair of descriptors works, the tests use pipe(2).
 *
 * - read() returns the next line without its terminating newline (a trailing
 *   carriage return is dropped as well). A final line without newline is
 *   returned at end of input, after which read() returns std::nullopt.
 * - write() appends a newline and writes the whole line, one line at a time
 *   even with several writers.
 *
 * Thread-safety: read() is meant for one reader thread, write() is safe from
 * any number of threads. read() blocks in read(2), a pthread cancellation
 * point, so a Gsn_Proc blocked in it can be stopped.
 */

#ifndef GSN_STDIO_HPP_
#define GSN_STDIO_HPP_

#include <unistd.h>

#include <mutex>
#include <optional>
#include <string>

#include "gsn-io.hpp"

namespace gsn {

class Gsn_Stdio : public Gsn_Io<std::string> {
public:
  /**
   * @brief Construct a Gsn_Stdio.
   *
   * @param in_fd            Descriptor lines are read from
   * @param out_fd           Descriptor lines are written to
   * @param close_on_destroy Close both descriptors in the destructor
   */
  explicit Gsn_Stdio(int in_fd = STDIN_FILENO, int out_fd = STDOUT_FILENO,
                     bool close_on_destroy = false);
  virtual ~Gsn_Stdio() noexcept;

  Gsn_Stdio(const Gsn_Stdio &obj) = delete;
  const Gsn_Stdio &operator=(const Gsn_Stdio &obj) = delete;
  Gsn_Stdio(Gsn_Stdio &&obj) = delete;
  Gsn_Stdio &operator=(Gsn_Stdio &&obj) = delete;

  /**
   * @throws std::runtime_error if read(2) fails.
   */
  auto read() -> std::optional<std::string> override;

  /**
   * @throws std::runtime_error if write(2) fails.
   */
  void write(std::string &item) override;
  void write(std::string &&item) override;

private:
  auto takeLine() -> std::optional<std::string>;

  int m_in_fd{-1};
  int m_out_fd{-1};
  bool m_close_on_destroy{};

  std::string m_read_buffer{};
  bool m_eof{};

  std::mutex m_write_mutex{};
}; // class Gsn_Stdio

} // namespace gsn

#endif // GSN_STDIO_HPP_
