/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef UTIL_HPP
#define UTIL_HPP

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

inline char tolower_ascii(char c) {

  if (c >= 'A' && c <= 'Z') {
    return c + ('a' - 'A');
  }
  return c;
}

inline bool ichar_equals(char a, char b) {
  return a == b || tolower_ascii(a) == tolower_ascii(b);
}

// Case insensitive string comparison
inline bool iequals(std::string_view a, std::string_view b) {
  return a.size() == b.size() &&
         std::ranges::equal(a, b, ichar_equals);
}

template <typename T>
concept StringLike = std::is_same_v<std::remove_cvref_t<T>, std::string> ||
                     std::is_same_v<std::remove_cvref_t<T>, std::string_view>;

template <StringLike T>
inline T trim(T str) {
  auto start = str.find_first_not_of(" \t\n\r");
  if (start == T::npos)
      return {};
  auto end = str.find_last_not_of(" \t\n\r");
  return str.substr(start, end - start + 1);
}

// split on every occurrence of delim. empty parts are kept, so "a..b"
// yields three parts.
template <StringLike T>
inline std::vector<T> split(T str, char delim) {
  std::vector<T> result;
  std::size_t start = 0;

  while (true) {
    auto pos = str.find(delim, start);
    if (pos == T::npos) {
      result.push_back(str.substr(start));
      break;
    }
    result.push_back(str.substr(start, pos - start));
    start = pos + 1;
  }
  return result;
}

template <StringLike T>
inline std::vector<T> split_trim(T str, char delim) {
  std::vector<T> result;
  for (auto part : split(str, delim)) {
    auto trimmed = trim(part);
    if (!trimmed.empty()) {
      result.push_back(trimmed);
    }
  }
  return result;
}

// checks for well-formed UTF-8: no overlong forms, no surrogates,
// nothing beyond U+10FFFF.
inline bool is_valid_utf8(std::string_view s) {
  std::size_t i = 0;
  const std::size_t n = s.size();

  while (i < n) {
    const auto c = static_cast<unsigned char>(s[i]);

    std::size_t len = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;

    if (c < 0x80) {
      ++i;
      continue;
    } else if (c >= 0xC2 && c <= 0xDF) {
      len = 2;
    } else if (c == 0xE0) {
      len = 3; lo = 0xA0;
    } else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) {
      len = 3;
    } else if (c == 0xED) {
      len = 3; hi = 0x9F;
    } else if (c == 0xF0) {
      len = 4; lo = 0x90;
    } else if (c >= 0xF1 && c <= 0xF3) {
      len = 4;
    } else if (c == 0xF4) {
      len = 4; hi = 0x8F;
    } else {
      return false;
    }

    if (i + len > n)
      return false;

    const auto c1 = static_cast<unsigned char>(s[i + 1]);
    if (c1 < lo || c1 > hi)
      return false;

    for (std::size_t k = 2; k < len; ++k) {
      const auto ck = static_cast<unsigned char>(s[i + k]);
      if (ck < 0x80 || ck > 0xBF)
        return false;
    }
    i += len;
  }
  return true;
}

#endif /* UTIL_HPP */
