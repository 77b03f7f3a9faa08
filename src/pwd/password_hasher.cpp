/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/pwd/password_hasher.hpp"
#include "authgate/logger.hpp"

#include <fmt/core.h>


namespace pwd {

stored_pwd_parts split_stored_pwd(std::string_view pwd_ref) {
  if (pwd_ref.size() < 2 || pwd_ref.front() != '#')
    throw pwd_with_scheme_failed_parse();

  const auto end = pwd_ref.find('#', 1);
  if (end == std::string_view::npos || end == 1)
    throw pwd_with_scheme_failed_parse();

  return { pwd_ref.substr(1, end - 1), pwd_ref.substr(end + 1) };
}

std::string hash_pwd_sync(const content_to_hash &to_hash, std::string_view key) {
  const auto s = scheme::get_scheme(scheme::DEFAULT_SCHEME);
  return fmt::format("#{}#{}", scheme::DEFAULT_SCHEME, scheme::hash(s, to_hash, key));
}

scheme_status validate_pwd_sync(const content_to_hash &to_hash, std::string_view pwd_ref,
                                std::string_view key) {
  const auto parts = split_stored_pwd(pwd_ref);
  const auto s = scheme::get_scheme(parts.scheme_id);

  scheme::validate(s, to_hash, parts.blob, key);

  if (parts.scheme_id != scheme::DEFAULT_SCHEME)
    return scheme_status::outdated;
  return scheme_status::ok;
}


password_hasher::password_hasher(const auth_settings_base &settings, hash_worker_pool &pool)
  : m_key(settings.get_pwd_key()),
    m_pool(pool) {}

std::string password_hasher::hash_pwd(const content_to_hash &to_hash) {
  return m_pool.run([to_hash, key = m_key]() {
    return hash_pwd_sync(to_hash, key);
  });
}

scheme_status password_hasher::validate_pwd(const content_to_hash &to_hash,
                                             const std::string &pwd_ref) {
  try {
    return m_pool.run([to_hash, pwd_ref, key = m_key]() {
      return validate_pwd_sync(to_hash, pwd_ref, key);
    });
  } catch (const scheme::pwd_validate_error &) {
    throw validate_error();
  } catch (const scheme::error &e) {
    logger::message("PWD", fmt::format("password validation error: {}", e.what()));
    throw validate_error();
  } catch (const pwd_with_scheme_failed_parse &e) {
    logger::message("PWD", fmt::format("password validation error: {}", e.what()));
    throw validate_error();
  }
}

} // namespace pwd
