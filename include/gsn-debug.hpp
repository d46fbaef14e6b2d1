/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-debug.hpp
 * @brief Debug print macro compiled out when NDEBUG is defined.
 *
 * GSN_DEBUG_PRINT(print_stmt) evaluates print_stmt in debug builds and expands
 * to an empty statement in release builds, so the argument must not carry side
 * effects the program relies on.
 *
 * A gossip node owns stdout for protocol traffic, diagnostics therefore always
 * go to std::cerr:
 *
 *   GSN_DEBUG_PRINT(std::cerr << "unknown ack " << value << '\n');
 */

#ifndef GSN_DEBUG_HPP_
#define GSN_DEBUG_HPP_

#include <iostream>

#ifdef NDEBUG
#define GSN_DEBUG_PRINT(print_stmt)                                            \
  do {                                                                         \
  } while (false)
#else
#define GSN_DEBUG_PRINT(print_stmt)                                            \
  do {                                                                         \
    (print_stmt);                                                              \
  } while (false)
#endif

#endif // GSN_DEBUG_HPP_
