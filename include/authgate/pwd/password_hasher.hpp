/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef PWD_PASSWORD_HASHER_HPP
#define PWD_PASSWORD_HASHER_HPP

#include "authgate/options.hpp"
#include "authgate/pwd/errors.hpp"
#include "authgate/pwd/hash_worker_pool.hpp"
#include "authgate/pwd/scheme.hpp"

#include <string>
#include <string_view>

namespace pwd {

enum class scheme_status {
  ok,
  // valid, but hashed with a scheme other than the default. the clear
  // password should be hashed again while it is at hand.
  outdated
};

struct stored_pwd_parts {
  std::string_view scheme_id;
  std::string_view blob;
};

// splits "#<scheme>#<blob>", throwing pwd_with_scheme_failed_parse.
stored_pwd_parts split_stored_pwd(std::string_view pwd_ref);

// hashes on the calling thread, returning "#<default scheme>#<blob>".
// scheme errors are passed through unchanged.
std::string hash_pwd_sync(const content_to_hash &to_hash, std::string_view key);

// validates on the calling thread. throws the precise scheme or parse
// error.
scheme_status validate_pwd_sync(const content_to_hash &to_hash, std::string_view pwd_ref,
                                std::string_view key);

/**
 * Password hashing and validation on the hash worker pool.
 *
 * validate_pwd reports every failure as validate_error, whatever the
 * cause; the cause is logged. dispatch_error is the exception, as it
 * says nothing about the password.
 */
class password_hasher {
public:
  password_hasher(const auth_settings_base &settings, hash_worker_pool &pool);

  std::string hash_pwd(const content_to_hash &to_hash);

  scheme_status validate_pwd(const content_to_hash &to_hash, const std::string &pwd_ref);

private:
  const std::string m_key;
  hash_worker_pool &m_pool;
};

} // namespace pwd

#endif /* PWD_PASSWORD_HASHER_HPP */
