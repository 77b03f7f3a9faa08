/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/auth_context.hpp"
#include "authgate/crypto.hpp"
#include "authgate/http.hpp"
#include "authgate/logger.hpp"

#include <boost/uuid/uuid_io.hpp>
#include <fmt/core.h>

namespace {

constexpr const char *CATEGORY = "MIDDLEWARE";

ctx_ext_failure fail(ctx_ext_error reason, std::string detail) {
  return { reason, std::move(detail) };
}

ctx_ext_result resolve(cookie_store &cookies, user_store &users,
                       const token::token_signer &signer,
                       std::chrono::system_clock::time_point now) {

  const auto text = cookies.get(AUTH_TOKEN);
  if (!text)
    return fail(ctx_ext_error::token_not_in_cookie, "no auth-token cookie");

  token::token t;
  try {
    t = token::parse(*text);
  } catch (const token::error &e) {
    return fail(ctx_ext_error::token_wrong_format, e.what());
  }

  std::optional<user_for_auth> user;
  try {
    user = users.first_for_auth_by_username(t.ident);
  } catch (const std::exception &e) {
    return fail(ctx_ext_error::model_access_error, e.what());
  }

  if (!user)
    return fail(ctx_ext_error::user_not_found, "no user for token identifier");

  try {
    signer.validate_web_token(t, boost::uuids::to_string(user->token_salt), now);
  } catch (const token::error &e) {
    return fail(ctx_ext_error::fail_validate, e.what());
  } catch (const crypto::error &e) {
    return fail(ctx_ext_error::fail_validate, e.what());
  }

  try {
    set_token_cookie(cookies, signer, user->username, user->token_salt, now);
  } catch (const cookie_error &e) {
    return fail(ctx_ext_error::cannot_set_token_cookie, e.what());
  } catch (const crypto::error &e) {
    return fail(ctx_ext_error::cannot_set_token_cookie, e.what());
  }

  try {
    return ctx::create(user->id);
  } catch (const ctx_create_error &e) {
    return fail(ctx_ext_error::ctx_create_fail, e.what());
  }
}

} // anonymous namespace

const char *to_string(ctx_ext_error e) {
  switch (e) {
  case ctx_ext_error::token_not_in_cookie:     return "TokenNotInCookie";
  case ctx_ext_error::token_wrong_format:      return "TokenWrongFormat";
  case ctx_ext_error::user_not_found:          return "UserNotFound";
  case ctx_ext_error::model_access_error:      return "ModelAccessError";
  case ctx_ext_error::fail_validate:           return "FailValidate";
  case ctx_ext_error::cannot_set_token_cookie: return "CannotSetTokenCookie";
  case ctx_ext_error::ctx_not_in_request_ext:  return "CtxNotInRequestExt";
  case ctx_ext_error::ctx_create_fail:         return "CtxCreateFail";
  }
  return "Unknown";
}

ctx_ext_result resolve_ctx(cookie_store &cookies, user_store &users,
                           const token::token_signer &signer,
                           std::chrono::system_clock::time_point now) {

  auto result = resolve(cookies, users, signer, now);

  if (const auto *c = std::get_if<ctx>(&result)) {
    logger::message(CATEGORY, fmt::format("resolved context for user {}", c->user_id()));
    return result;
  }

  const auto &failure = std::get<ctx_ext_failure>(result);
  logger::message(CATEGORY, fmt::format("no context: {} ({})", to_string(failure.reason), failure.detail));

  if (failure.reason != ctx_ext_error::token_not_in_cookie) {
    try {
      remove_token_cookie(cookies);
    } catch (const cookie_error &e) {
      logger::message(CATEGORY, fmt::format("cannot remove auth-token cookie: {}", e.what()));
    }
  }

  return result;
}

const ctx &require_ctx(const std::optional<ctx_ext_result> &result) {
  if (!result)
    throw http::no_auth(fmt::format("authentication required: {}",
                                    to_string(ctx_ext_error::ctx_not_in_request_ext)));

  if (const auto *failure = std::get_if<ctx_ext_failure>(&*result))
    throw http::no_auth(fmt::format("authentication required: {}", to_string(failure->reason)));

  return std::get<ctx>(*result);
}
