/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef AUTH_CONTEXT_HPP
#define AUTH_CONTEXT_HPP

#include "authgate/cookies.hpp"
#include "authgate/ctx.hpp"
#include "authgate/token.hpp"
#include "authgate/user_store.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <variant>

enum class ctx_ext_error {
  token_not_in_cookie,
  token_wrong_format,
  user_not_found,
  model_access_error,
  fail_validate,
  cannot_set_token_cookie,
  ctx_not_in_request_ext,
  ctx_create_fail
};

const char *to_string(ctx_ext_error e);

struct ctx_ext_failure {
  ctx_ext_error reason;
  // internal detail, for the log only
  std::string detail;
};

using ctx_ext_result = std::variant<ctx, ctx_ext_failure>;

/**
 * Resolves the caller of a request from the auth-token cookie.
 *
 * The token is parsed, its user looked up, its signature and expiry
 * checked, and a fresh token is written back. Never throws: every
 * outcome is returned. On any failure except a missing cookie, the
 * cookie is removed.
 */
ctx_ext_result resolve_ctx(cookie_store &cookies, user_store &users,
                           const token::token_signer &signer,
                           std::chrono::system_clock::time_point now);

/**
 * The context of an authenticated request. Throws http::no_auth when
 * resolution failed or never ran.
 */
const ctx &require_ctx(const std::optional<ctx_ext_result> &result);

#endif /* AUTH_CONTEXT_HPP */
