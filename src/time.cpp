/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/time.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <ctime>
#include <stdexcept>
#include <string_view>

#include <fmt/core.h>

namespace {

[[noreturn]] void parse_failure(const std::string &s) {
  throw std::runtime_error(fmt::format("Unable to parse string '{}' as an RFC 3339 format date time.", s));
}

bool all_digits(std::string_view sv) {
  for (char c : sv) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return false;
  }
  return !sv.empty();
}

int to_int(std::string_view sv) {
  int value = 0;
  std::from_chars(sv.data(), sv.data() + sv.size(), value);
  return value;
}

}

std::chrono::system_clock::time_point parse_time(const std::string &s) {
  using namespace std::chrono;

  // fixed part: YYYY-MM-DDTHH:MM:SS
  if (s.size() < 20)
    parse_failure(s);

  const std::string_view sv(s);

  constexpr std::array digit_ranges = {
    std::pair{0, 4}, std::pair{5, 2}, std::pair{8, 2},
    std::pair{11, 2}, std::pair{14, 2}, std::pair{17, 2}
  };

  for (auto [pos, len] : digit_ranges) {
    if (!all_digits(sv.substr(pos, len)))
      parse_failure(s);
  }

  if (s[4] != '-' || s[7] != '-' || (s[10] != 'T' && s[10] != 't') ||
      s[13] != ':' || s[16] != ':')
    parse_failure(s);

  std::string fixed = s.substr(0, 19);
  fixed[10] = 'T';

  std::tm tm{};
  const char *end = strptime(fixed.c_str(), "%Y-%m-%dT%H:%M:%S", &tm);
  if (end == nullptr || *end != '\0')
    parse_failure(s);

  auto rest = sv.substr(19);

  nanoseconds fraction{0};
  if (rest.front() == '.') {
    rest.remove_prefix(1);
    std::size_t n = 0;
    while (n < rest.size() && std::isdigit(static_cast<unsigned char>(rest[n])))
      ++n;
    if (n == 0 || n > 9)
      parse_failure(s);

    long long value = 0;
    for (std::size_t i = 0; i < 9; ++i)
      value = value * 10 + (i < n ? rest[i] - '0' : 0);

    fraction = nanoseconds(value);
    rest.remove_prefix(n);
  }

  minutes offset{0};
  if (rest == "Z" || rest == "z") {
    // UTC
  } else if (rest.size() == 6 && (rest[0] == '+' || rest[0] == '-') && rest[3] == ':' &&
             all_digits(rest.substr(1, 2)) && all_digits(rest.substr(4, 2))) {
    const int hh = to_int(rest.substr(1, 2));
    const int mm = to_int(rest.substr(4, 2));
    if (hh > 23 || mm > 59)
      parse_failure(s);
    offset = hours(hh) + minutes(mm);
    if (rest[0] == '-')
      offset = -offset;
  } else {
    parse_failure(s);
  }

  auto tp = system_clock::from_time_t(timegm(&tm));
  return tp + duration_cast<system_clock::duration>(fraction) - offset;
}

std::string format_time(const std::chrono::system_clock::time_point &tp) {
  using namespace std::chrono;

  const auto secs = floor<seconds>(tp);
  const auto nanos = duration_cast<nanoseconds>(tp - secs).count();

  const std::time_t t = system_clock::to_time_t(secs);
  std::tm tm{};
  gmtime_r(&t, &tm);

  auto result = fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}",
                            tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                            tm.tm_hour, tm.tm_min, tm.tm_sec);

  if (nanos > 0) {
    auto frac = fmt::format("{:09d}", nanos);
    while (frac.back() == '0')
      frac.pop_back();
    result += '.';
    result += frac;
  }

  result += 'Z';
  return result;
}

std::chrono::system_clock::time_point now_plus_sec(const std::chrono::system_clock::time_point &now,
                                                   double sec) {
  return now + std::chrono::round<std::chrono::system_clock::duration>(std::chrono::duration<double>(sec));
}
