/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/pwd/scheme.hpp"
#include "test_settings.hpp"

#include <string>
#include <variant>

#include <boost/uuid/nil_generator.hpp>
#include <boost/uuid/string_generator.hpp>

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

using namespace pwd;

namespace {

boost::uuids::uuid uuid_of(const char *text) {
  return boost::uuids::string_generator()(text);
}

const auto SALT = uuid_of("f05e8961-d6ad-4086-9e78-a6de065e5453");

}

TEST_CASE("scheme 01 known hashes", "[pwd]") {
  const scheme::scheme_01 s;
  const auto key = test_pwd_key();

  CHECK(s.hash({"hello world", SALT}, key) ==
        "spdJNN5_TnybC1q06kabhNsJo8pp6PSK9txZNiZ4V3imvaBrqIgowC9EEcuallIji_YJmpNEPgxqWeb6NthCdw");
  CHECK(s.hash({"welcome", SALT}, key) ==
        "VufyJ7tM-1DBfUay3iRRgXhQWENhFTotYwtTPkoaDAyNqR_nnxuFymH0V8T0CsHBWpi4hTPhjXGf6A7Y2xFMZw");
  CHECK(s.hash({"hello world", uuid_of("00000000-0000-0000-0000-000000000001")}, key) ==
        "7krdH7XufEGEKatFwWl-7Yqicm9oD5_u__uBy5zEPWZSEC7D190OgbZL9sFaFkWhqQwzTvKf7KHV6sbkdTihPg");
}

TEST_CASE("scheme 01 validation", "[pwd]") {
  const scheme::scheme_01 s;
  const auto key = test_pwd_key();
  const std::string blob = "spdJNN5_TnybC1q06kabhNsJo8pp6PSK9txZNiZ4V3imvaBrqIgowC9EEcuallIji_YJmpNEPgxqWeb6NthCdw";

  CHECK_NOTHROW(s.validate({"hello world", SALT}, blob, key));
  CHECK_THROWS_AS(s.validate({"hello world!", SALT}, blob, key), scheme::pwd_validate_error);

  // the salt is not in the blob, so a new salt invalidates the hash
  CHECK_THROWS_AS(s.validate({"hello world", uuid_of("00000000-0000-0000-0000-000000000001")}, blob, key),
                  scheme::pwd_validate_error);

  CHECK_THROWS_AS(s.validate({"hello world", SALT}, blob, test_token_key()), scheme::pwd_validate_error);
}

TEST_CASE("scheme 01 rejects missing key and nil salt", "[pwd]") {
  const scheme::scheme_01 s;
  CHECK_THROWS_AS(s.hash({"hello world", SALT}, ""), scheme::key_error);
  CHECK_THROWS_AS(s.hash({"hello world", boost::uuids::nil_uuid()}, test_pwd_key()), scheme::salt_error);
}

TEST_CASE("scheme 02 hash is a self-describing argon2id string", "[pwd]") {
  const scheme::scheme_02 s;
  const auto blob = s.hash({"welcome", SALT}, test_pwd_key());

  CHECK(blob.rfind("$argon2id$v=19$m=19456,t=2,p=1$8F6JYdatQIaeeKbeBl5UUw$", 0) == 0);
  // 32 bytes of output, 43 characters unpadded
  CHECK(blob.size() == std::string("$argon2id$v=19$m=19456,t=2,p=1$8F6JYdatQIaeeKbeBl5UUw$").size() + 43);

  // same input, same output
  CHECK(s.hash({"welcome", SALT}, test_pwd_key()) == blob);
}

TEST_CASE("scheme 02 validation", "[pwd]") {
  const scheme::scheme_02 s;
  const auto key = test_pwd_key();
  const auto blob = s.hash({"welcome", SALT}, key);

  CHECK_NOTHROW(s.validate({"welcome", SALT}, blob, key));
  CHECK_THROWS_AS(s.validate({"welcome!", SALT}, blob, key), scheme::pwd_validate_error);

  // the key is an argon2 secret
  CHECK_THROWS_AS(s.validate({"welcome", SALT}, blob, test_token_key()), scheme::pwd_validate_error);
}

TEST_CASE("scheme 02 validation ignores the salt outside the blob", "[pwd]") {
  const scheme::scheme_02 s;
  const auto key = test_pwd_key();
  const auto blob = s.hash({"welcome", SALT}, key);

  CHECK_NOTHROW(s.validate({"welcome", uuid_of("00000000-0000-0000-0000-000000000001")}, blob, key));
  CHECK_NOTHROW(s.validate({"welcome", boost::uuids::nil_uuid()}, blob, key));
}

TEST_CASE("scheme 02 rejects malformed blobs", "[pwd]") {
  const scheme::scheme_02 s;
  const auto key = test_pwd_key();

  CHECK_THROWS_AS(s.validate({"welcome", SALT}, "", key), scheme::hash_error);
  CHECK_THROWS_AS(s.validate({"welcome", SALT}, "spdJNN5_TnybC1q06kabhNsJo8pp6PSK9txZNiZ4V3imvaBrqIgowC9EEcuallIji_YJmpNEPgxqWeb6NthCdw", key),
                  scheme::hash_error);
  CHECK_THROWS_AS(s.validate({"welcome", SALT},
                             "$argon2i$v=19$m=19456,t=2,p=1$8F6JYdatQIaeeKbeBl5UUw$AAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA", key),
                  scheme::hash_error);
  CHECK_THROWS_AS(s.validate({"welcome", SALT},
                             "$argon2id$v=16$m=19456,t=2,p=1$8F6JYdatQIaeeKbeBl5UUw$AAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA", key),
                  scheme::hash_error);
  CHECK_THROWS_AS(s.validate({"welcome", SALT},
                             "$argon2id$v=19$m=19456,t=2$8F6JYdatQIaeeKbeBl5UUw$AAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA", key),
                  scheme::hash_error);
  // memory cost far above what is accepted back from storage
  CHECK_THROWS_AS(s.validate({"welcome", SALT},
                             "$argon2id$v=19$m=4000000000,t=2,p=1$8F6JYdatQIaeeKbeBl5UUw$AAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA", key),
                  scheme::hash_error);
  CHECK_THROWS_AS(s.validate({"welcome", SALT},
                             "$argon2id$v=19$m=19456,t=2,p=1$8F6JYdatQIaeeKbeBl5UUw$not-base64!", key),
                  scheme::hash_error);
}

TEST_CASE("scheme 02 rejects missing key and nil salt", "[pwd]") {
  const scheme::scheme_02 s;
  CHECK_THROWS_AS(s.hash({"welcome", SALT}, ""), scheme::key_error);
  CHECK_THROWS_AS(s.hash({"welcome", boost::uuids::nil_uuid()}, test_pwd_key()), scheme::salt_error);
}

TEST_CASE("scheme lookup", "[pwd]") {
  CHECK(std::holds_alternative<scheme::scheme_01>(scheme::get_scheme("01")));
  CHECK(std::holds_alternative<scheme::scheme_02>(scheme::get_scheme("02")));
  CHECK(scheme::DEFAULT_SCHEME == "02");

  try {
    scheme::get_scheme("03");
    FAIL("expected scheme_not_found");
  } catch (const scheme::scheme_not_found &e) {
    CHECK(e.id() == "03");
  }

  const auto s = scheme::get_scheme("01");
  CHECK(scheme::hash(s, {"welcome", SALT}, test_pwd_key()) ==
        "VufyJ7tM-1DBfUay3iRRgXhQWENhFTotYwtTPkoaDAyNqR_nnxuFymH0V8T0CsHBWpi4hTPhjXGf6A7Y2xFMZw");
}
