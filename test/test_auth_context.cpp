/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/auth_context.hpp"
#include "authgate/http.hpp"
#include "authgate/time.hpp"
#include "test_request.hpp"
#include "test_settings.hpp"
#include "test_user_store.hpp"

#include <string>
#include <variant>

#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

using namespace std::chrono_literals;

namespace {

const auto TOKEN_SALT = boost::uuids::string_generator()("5b7c4a3e-1f2d-4e6a-9b8c-0d1e2f3a4b5c");
const auto PWD_SALT = boost::uuids::string_generator()("f05e8961-d6ad-4086-9e78-a6de065e5453");
const auto NOW = parse_time("2023-11-25T11:30:00Z");

struct fixture {
  test_settings settings;
  token::token_signer signer{settings};
  test_user_table table;
  test_request req;

  fixture() {
    table.add(user_for_login{ 3, "demo1", std::nullopt, PWD_SALT, TOKEN_SALT });
  }

  std::string token_for(const std::string &username, std::chrono::system_clock::time_point at) {
    return token::to_string(signer.generate_web_token(username, boost::uuids::to_string(TOKEN_SALT), at));
  }

  ctx_ext_result resolve(std::chrono::system_clock::time_point now = NOW) {
    request_cookie_store cookies(req);
    test_user_store users(table);
    return resolve_ctx(cookies, users, signer, now);
  }

  ctx_ext_error failure(const ctx_ext_result &r) {
    REQUIRE(std::holds_alternative<ctx_ext_failure>(r));
    return std::get<ctx_ext_failure>(r).reason;
  }

  std::vector<std::string> set_cookies() {
    req.status(200).finish();
    return req.response_headers("Set-Cookie");
  }
};

}

TEST_CASE_METHOD(fixture, "valid token resolves to the user", "[auth]") {
  req.set_header("HTTP_COOKIE", "auth-token=" + token_for("demo1", NOW - 10s));

  const auto r = resolve();
  REQUIRE(std::holds_alternative<ctx>(r));
  CHECK(std::get<ctx>(r).user_id() == 3);

  // a fresh token goes back to the client
  const auto cookies = set_cookies();
  REQUIRE(cookies.size() == 1);
  CHECK(cookies[0].rfind("auth-token=" + token_for("demo1", NOW), 0) == 0);
}

TEST_CASE_METHOD(fixture, "missing cookie", "[auth]") {
  CHECK(failure(resolve()) == ctx_ext_error::token_not_in_cookie);
  // nothing to remove
  CHECK(set_cookies().empty());
}

TEST_CASE_METHOD(fixture, "malformed token", "[auth]") {
  req.set_header("HTTP_COOKIE", "auth-token=not-a-token");
  CHECK(failure(resolve()) == ctx_ext_error::token_wrong_format);

  const auto cookies = set_cookies();
  REQUIRE(cookies.size() == 1);
  CHECK(cookies[0].find("Max-Age=0") != std::string::npos);
}

TEST_CASE_METHOD(fixture, "unknown user", "[auth]") {
  req.set_header("HTTP_COOKIE", "auth-token=" + token_for("demo2", NOW));
  CHECK(failure(resolve()) == ctx_ext_error::user_not_found);
  CHECK(set_cookies().size() == 1);
}

TEST_CASE_METHOD(fixture, "store failure", "[auth]") {
  req.set_header("HTTP_COOKIE", "auth-token=" + token_for("demo1", NOW));
  table.broken = true;
  CHECK(failure(resolve()) == ctx_ext_error::model_access_error);
}

TEST_CASE_METHOD(fixture, "expired token", "[auth]") {
  // issued one lifetime ago, expiring exactly now
  req.set_header("HTTP_COOKIE", "auth-token=" + token_for("demo1", NOW - 1800s));
  CHECK(failure(resolve()) == ctx_ext_error::fail_validate);
  CHECK(set_cookies().size() == 1);
}

TEST_CASE_METHOD(fixture, "token salt rotated", "[auth]") {
  req.set_header("HTTP_COOKIE", "auth-token=" + token_for("demo1", NOW));
  table.users[3].token_salt = PWD_SALT;
  CHECK(failure(resolve()) == ctx_ext_error::fail_validate);
}

TEST_CASE_METHOD(fixture, "response already started", "[auth]") {
  req.set_header("HTTP_COOKIE", "auth-token=" + token_for("demo1", NOW));
  req.status(200).put("{}");
  CHECK(failure(resolve()) == ctx_ext_error::cannot_set_token_cookie);
}

TEST_CASE_METHOD(fixture, "root user id can't come from a token", "[auth]") {
  table.add(user_for_login{ 0, "root", std::nullopt, PWD_SALT, TOKEN_SALT });
  req.set_header("HTTP_COOKIE", "auth-token=" + token_for("root", NOW));
  CHECK(failure(resolve()) == ctx_ext_error::ctx_create_fail);
}

TEST_CASE("require context", "[auth]") {
  CHECK_THROWS_AS(require_ctx(std::nullopt), http::no_auth);

  const std::optional<ctx_ext_result> failed = ctx_ext_result{ ctx_ext_failure{ ctx_ext_error::user_not_found, "" } };
  CHECK_THROWS_AS(require_ctx(failed), http::no_auth);

  const std::optional<ctx_ext_result> ok = ctx_ext_result{ ctx::create(12) };
  CHECK(require_ctx(ok).user_id() == 12);
}

TEST_CASE("contexts", "[auth]") {
  CHECK(ctx::root_ctx().user_id() == 0);
  CHECK(ctx::create(5) == ctx::create(5));
  CHECK_THROWS_AS(ctx::create(0), ctx_create_error);
}

TEST_CASE("failure names", "[auth]") {
  CHECK(std::string(to_string(ctx_ext_error::token_not_in_cookie)) == "TokenNotInCookie");
  CHECK(std::string(to_string(ctx_ext_error::fail_validate)) == "FailValidate");
}
