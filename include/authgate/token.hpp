/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef TOKEN_HPP
#define TOKEN_HPP

#include "authgate/options.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <string_view>

namespace token {

class error : public std::runtime_error {
public:
  explicit error(const std::string &message) : std::runtime_error(message) {}
};

class invalid_format : public error {
public:
  invalid_format() : error("token must have three non-empty parts") {}
};

class cannot_decode_ident : public error {
public:
  cannot_decode_ident() : error("cannot decode token identifier") {}
};

class cannot_decode_exp : public error {
public:
  cannot_decode_exp() : error("cannot decode token expiration") {}
};

class signature_not_matching : public error {
public:
  signature_not_matching() : error("token signature does not match") {}
};

class exp_not_iso : public error {
public:
  exp_not_iso() : error("token expiration is not an RFC 3339 time") {}
};

class expired : public error {
public:
  expired() : error("token has expired") {}
};

/**
 * A session token: b64u(ident) "." b64u(exp) "." signature.
 */
struct token {
  std::string ident;
  std::string exp;
  std::string sign_b64u;

  bool operator==(const token &) const = default;
};

token parse(std::string_view text);

std::string to_string(const token &t);

// the signed text: b64u(ident) "." b64u(exp)
std::string signed_content(const token &t);

token generate_token(const std::string &ident, double duration_sec,
                     std::string_view salt, std::string_view key,
                     std::chrono::system_clock::time_point now);

// throws signature_not_matching, exp_not_iso or expired.
void validate_token_sign_and_exp(const token &t, std::string_view salt, std::string_view key,
                                 std::chrono::system_clock::time_point now);

/**
 * Token generation and validation with the process token key and
 * lifetime.
 */
class token_signer {
public:
  explicit token_signer(const auth_settings_base &settings);

  token generate_web_token(const std::string &ident, std::string_view salt,
                           std::chrono::system_clock::time_point now) const;

  void validate_web_token(const token &t, std::string_view salt,
                          std::chrono::system_clock::time_point now) const;

private:
  const std::string m_key;
  const double m_duration_sec;
};

} // namespace token

#endif /* TOKEN_HPP */
