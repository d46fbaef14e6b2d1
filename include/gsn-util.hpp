/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-util.hpp
 * @brief Small header-only helpers shared across the project.
 *
 *  - incrementByOne<T>(T) : next value of a counter that never yields 0, used
 *    for message ids so that a wrapped counter never produces the "absent" id.
 *  - stringCompare(...)   : equality with optional ASCII case folding, used
 *    when parsing configuration keywords.
 */

#ifndef GSN_UTIL_HPP_
#define GSN_UTIL_HPP_

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace gsn {

/**
 * @brief Return max(1, value + 1). For unsigned T a wrap to 0 yields 1.
 */
template <typename T> inline T incrementByOne(T value) {
  return std::max<T>(1, value + 1);
}

inline bool stringCompare(const std::string_view str1,
                          const std::string_view str2,
                          bool caseInsensitive = true) {
  std::string str_value1{str1};
  std::string str_value2{str2};

  if (caseInsensitive) {
    auto lower = [](unsigned char c) -> char { return std::tolower(c); };

    std::transform(str_value1.begin(), str_value1.end(), str_value1.begin(),
                   lower);
    std::transform(str_value2.begin(), str_value2.end(), str_value2.begin(),
                   lower);
  }

  return str_value1 == str_value2;
}

} // namespace gsn

#endif // GSN_UTIL_HPP_
