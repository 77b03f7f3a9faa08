/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/api/login_handler.hpp"
#include "authgate/cookies.hpp"
#include "authgate/crypto.hpp"
#include "authgate/json_payload.hpp"
#include "authgate/json_response.hpp"
#include "authgate/logger.hpp"
#include "authgate/request_context.hpp"
#include "authgate/request_helpers.hpp"

#include <fmt/core.h>

namespace api {

namespace {

constexpr const char *CATEGORY = "HANDLER";

// a failed upgrade is not a failed login, the old hash still works.
void upgrade_pwd(RequestContext &req_ctx, int64_t user_id, const std::string &clear_pwd) {
  try {
    update_user_pwd(req_ctx.users, req_ctx.services.hasher, user_id, clear_pwd);
    logger::message(CATEGORY, fmt::format("password of user {} rehashed with scheme {}",
                                          user_id, pwd::scheme::DEFAULT_SCHEME));
  } catch (const user_store_error &e) {
    logger::message(CATEGORY, fmt::format("cannot rehash password of user {}: {}", user_id, e.what()));
  } catch (const pwd::error &e) {
    logger::message(CATEGORY, fmt::format("cannot rehash password of user {}: {}", user_id, e.what()));
  } catch (const pwd::scheme::error &e) {
    logger::message(CATEGORY, fmt::format("cannot rehash password of user {}: {}", user_id, e.what()));
  }
}

} // anonymous namespace

login_handler::login_handler()
  : handler(http::method::POST, false) {}

std::string login_handler::log_name() const { return "login"; }

void login_handler::handle(RequestContext &req_ctx) const {
  if (!has_json_content_type(req_ctx.req))
    throw http::unsupported_media_type("login expects an application/json body");

  const json_payload payload(req_ctx.req.get_payload());
  const auto username = payload.get_string("username");
  const auto clear_pwd = payload.get_string("pwd");

  if (!username || !clear_pwd)
    throw http::bad_request("login needs the string fields username and pwd");

  std::optional<user_for_login> user;
  try {
    user = req_ctx.users.first_for_login_by_username(*username);
  } catch (const user_store_error &e) {
    throw http::server_error(e.what());
  }

  if (!user)
    throw http::login_fail("unknown username");

  if (!user->pwd)
    throw http::login_fail(fmt::format("user {} has no password", user->id));

  pwd::scheme_status status;
  try {
    status = req_ctx.services.hasher.validate_pwd(pwd::content_to_hash{ *clear_pwd, user->pwd_salt },
                                                  *user->pwd);
  } catch (const pwd::validate_error &) {
    throw http::login_fail(fmt::format("wrong password for user {}", user->id));
  } catch (const pwd::dispatch_error &e) {
    throw http::service_unavailable(e.what());
  }

  if (status == pwd::scheme_status::outdated)
    upgrade_pwd(req_ctx, user->id, *clear_pwd);

  try {
    set_token_cookie(req_ctx.cookies, req_ctx.services.signer, user->username,
                     user->token_salt, req_ctx.req.get_current_time());
  } catch (const cookie_error &e) {
    throw http::server_error(e.what());
  } catch (const crypto::error &e) {
    throw http::server_error(e.what());
  }

  logger::message(CATEGORY, fmt::format("user {} logged in", user->id));

  respond_result(req_ctx.req, [](json_writer &w) {
    w.property("success", true);
  });
}

} // namespace api
