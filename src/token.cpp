/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/token.hpp"
#include "authgate/base64.hpp"
#include "authgate/crypto.hpp"
#include "authgate/time.hpp"
#include "authgate/util.hpp"

#include <fmt/core.h>


namespace token {

token parse(std::string_view text) {
  const auto parts = split(text, '.');

  if (parts.size() != 3 || parts[0].empty() || parts[1].empty() || parts[2].empty())
    throw invalid_format();

  token t;

  try {
    t.ident = b64u::decode_to_string(parts[0]);
  } catch (const b64u::decode_error &) {
    throw cannot_decode_ident();
  }

  try {
    t.exp = b64u::decode_to_string(parts[1]);
  } catch (const b64u::decode_error &) {
    throw cannot_decode_exp();
  }

  t.sign_b64u = std::string(parts[2]);
  return t;
}

std::string signed_content(const token &t) {
  return fmt::format("{}.{}", b64u::encode(t.ident), b64u::encode(t.exp));
}

std::string to_string(const token &t) {
  return fmt::format("{}.{}", signed_content(t), t.sign_b64u);
}

token generate_token(const std::string &ident, double duration_sec,
                     std::string_view salt, std::string_view key,
                     std::chrono::system_clock::time_point now) {
  token t;
  t.ident = ident;
  t.exp = format_time(now_plus_sec(now, duration_sec));
  t.sign_b64u = crypto::hmac_sha512_b64u(key, signed_content(t), salt);
  return t;
}

void validate_token_sign_and_exp(const token &t, std::string_view salt, std::string_view key,
                                 std::chrono::system_clock::time_point now) {
  const auto expected = crypto::hmac_sha512_b64u(key, signed_content(t), salt);

  if (!crypto::constant_time_equals(expected, t.sign_b64u))
    throw signature_not_matching();

  std::chrono::system_clock::time_point exp;
  try {
    exp = parse_time(t.exp);
  } catch (const std::runtime_error &) {
    throw exp_not_iso();
  }

  if (exp <= now)
    throw expired();
}


token_signer::token_signer(const auth_settings_base &settings)
  : m_key(settings.get_token_key()),
    m_duration_sec(settings.get_token_duration_sec()) {}

token token_signer::generate_web_token(const std::string &ident, std::string_view salt,
                                       std::chrono::system_clock::time_point now) const {
  return generate_token(ident, m_duration_sec, salt, m_key, now);
}

void token_signer::validate_web_token(const token &t, std::string_view salt,
                                      std::chrono::system_clock::time_point now) const {
  validate_token_sign_and_exp(t, salt, m_key, now);
}

} // namespace token
