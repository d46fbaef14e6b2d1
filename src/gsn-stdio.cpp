/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-stdio.cpp
 * @brief Implementation of Gsn_Stdio.
 */

#include "gsn-stdio.hpp"

#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstdio>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace gsn {

Gsn_Stdio::Gsn_Stdio(int in_fd, int out_fd, bool close_on_destroy)
    : m_in_fd{in_fd}, m_out_fd{out_fd}, m_close_on_destroy{close_on_destroy} {}

Gsn_Stdio::~Gsn_Stdio() noexcept try {
  if (m_close_on_destroy) {
    if (-1 != m_in_fd) {
      close(m_in_fd);
    }

    if (-1 != m_out_fd && m_out_fd != m_in_fd) {
      close(m_out_fd);
    }
  }
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

auto Gsn_Stdio::takeLine() -> std::optional<std::string> {
  auto pos = m_read_buffer.find('\n');
  if (std::string::npos == pos) {
    return {};
  }

  std::string line = m_read_buffer.substr(0, pos);
  m_read_buffer.erase(0, pos + 1);

  if (!line.empty() && '\r' == line.back()) {
    line.pop_back();
  }

  return line;
}

auto Gsn_Stdio::read() -> std::optional<std::string> {
  std::array<char, BUFSIZ> buf{};

  while (true) {
    auto line = takeLine();
    if (line) {
      return line;
    }

    if (m_eof) {
      if (m_read_buffer.empty()) {
        return {};
      }

      return std::exchange(m_read_buffer, std::string{});
    }

    const ssize_t n_read = ::read(m_in_fd, buf.data(), buf.size());
    if (n_read < 0) {
      if (EINTR == errno) {
        continue;
      }

      throw std::runtime_error("Error in read: " +
                               std::system_category().message(errno));
    }

    if (0 == n_read) {
      m_eof = true;
    } else {
      m_read_buffer.append(buf.data(), static_cast<size_t>(n_read));
    }
  }
}

void Gsn_Stdio::write(std::string &item) {
  std::string line{item};
  line.push_back('\n');

  const std::lock_guard<std::mutex> lock(m_write_mutex);

  size_t n_written{};
  while (n_written < line.size()) {
    const ssize_t n_write = ::write(m_out_fd, line.data() + n_written,
                                    line.size() - n_written);
    if (n_write < 0) {
      if (EINTR == errno) {
        continue;
      }

      throw std::runtime_error("Error in write: " +
                               std::system_category().message(errno));
    }

    n_written += static_cast<size_t>(n_write);
  }
}

void Gsn_Stdio::write(std::string &&item) {
  std::string moved_item = std::move(item);

  write(moved_item);
}

} // namespace gsn
