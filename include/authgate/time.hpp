/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef UTIL_TIME_HPP
#define UTIL_TIME_HPP

#include <string>
#include <chrono>

// parse an RFC 3339 time string, e.g. 2023-11-25T11:30:00Z,
// 2023-11-25T11:30:00.250Z or 2023-11-25T12:30:00+01:00
std::chrono::system_clock::time_point parse_time(const std::string &);

// format as RFC 3339 in UTC. sub-second digits are only written when
// present, with trailing zeros removed.
std::string format_time(const std::chrono::system_clock::time_point &);

std::chrono::system_clock::time_point now_plus_sec(const std::chrono::system_clock::time_point &now,
                                                   double sec);

#endif /* UTIL_TIME_HPP */
