/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef PWD_ERRORS_HPP
#define PWD_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace pwd {

class error : public std::runtime_error {
public:
  explicit error(const std::string &message) : std::runtime_error(message) {}
};

// the stored hash has no leading #<scheme>#
class pwd_with_scheme_failed_parse : public error {
public:
  pwd_with_scheme_failed_parse() : error("stored password has no #<scheme>#<blob> form") {}
};

// the only validation failure callers ever see
class validate_error : public error {
public:
  validate_error() : error("password validation failed") {}
};

// the hashing work could not be run or did not finish in time
class dispatch_error : public error {
public:
  explicit dispatch_error(const std::string &message) : error(message) {}
};

} // namespace pwd

#endif /* PWD_ERRORS_HPP */
