/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/cookies.hpp"
#include "authgate/time.hpp"
#include "test_request.hpp"
#include "test_settings.hpp"

#include <string>

#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

using namespace std::chrono_literals;

TEST_CASE("parse cookie header", "[cookies]") {
  const auto c = parse_cookie_header("a=1; auth-token=abc.def.ghi ;b=\"quoted\"; a=2; junk; =x");
  CHECK(c.size() == 3);
  CHECK(c.at("a") == "1");
  CHECK(c.at("auth-token") == "abc.def.ghi");
  CHECK(c.at("b") == "quoted");

  CHECK(parse_cookie_header("").empty());
}

TEST_CASE("read cookies from the request", "[cookies]") {
  test_request req;
  req.set_header("HTTP_COOKIE", "auth-token=t1; theme=dark");

  request_cookie_store cookies(req);
  CHECK(cookies.get(AUTH_TOKEN) == "t1");
  CHECK(cookies.get("theme") == "dark");
  CHECK_FALSE(cookies.get("missing"));
}

TEST_CASE("request without cookies", "[cookies]") {
  test_request req;
  request_cookie_store cookies(req);
  CHECK_FALSE(cookies.get(AUTH_TOKEN));
}

TEST_CASE("set and remove cookies", "[cookies]") {
  test_request req;
  request_cookie_store cookies(req);

  cookies.set(AUTH_TOKEN, "v1");
  CHECK(cookies.get(AUTH_TOKEN) == "v1");
  cookies.remove(AUTH_TOKEN);
  CHECK_FALSE(cookies.get(AUTH_TOKEN));

  req.status(200).finish();

  const auto set_cookie = req.response_headers("Set-Cookie");
  REQUIRE(set_cookie.size() == 2);
  CHECK(set_cookie[0] == "auth-token=v1; HttpOnly; Path=/");
  CHECK(set_cookie[1].rfind("auth-token=; HttpOnly; Path=/; Max-Age=0", 0) == 0);
}

TEST_CASE("cookies can't be set once the headers are out", "[cookies]") {
  test_request req;
  request_cookie_store cookies(req);

  req.status(200).put("{}");

  CHECK_THROWS_AS(cookies.set(AUTH_TOKEN, "v1"), cookie_error);
  CHECK_THROWS_AS(cookies.remove(AUTH_TOKEN), cookie_error);
}

TEST_CASE("token cookie", "[cookies]") {
  test_settings settings;
  const token::token_signer signer(settings);
  const auto salt = boost::uuids::string_generator()("f05e8961-d6ad-4086-9e78-a6de065e5453");
  const auto now = parse_time("2023-11-25T11:30:00Z");

  test_request req;
  request_cookie_store cookies(req);
  set_token_cookie(cookies, signer, "fx-user-01", salt, now);

  const auto value = cookies.get(AUTH_TOKEN);
  REQUIRE(value);

  const auto t = token::parse(*value);
  CHECK(t.ident == "fx-user-01");
  CHECK(t.exp == "2023-11-25T12:00:00Z");

  // the token salt is the textual uuid
  CHECK_NOTHROW(signer.validate_web_token(t, "f05e8961-d6ad-4086-9e78-a6de065e5453", now + 1s));

  remove_token_cookie(cookies);
  CHECK_FALSE(cookies.get(AUTH_TOKEN));
}
