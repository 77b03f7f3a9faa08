/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/options.hpp"

#include <chrono>
#include <set>
#include <string>
#include <vector>
#include <stdexcept>

#include <boost/program_options.hpp>

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

namespace po = boost::program_options;

namespace {

const std::string PWD_KEY = "AAECAwQFBgcICQoLDA0ODxAREhMUFRYXGBkaGxwdHh8gISIjJCUmJygpKissLS4vMDEyMzQ1Njc4OTo7PD0-Pw";
const std::string TOKEN_KEY = "QEFCQ0RFRkdISUpLTE1OT1BRUlNUVVZXWFlaW1xdXl9gYWJjZGVmZ2hpamtsbW5vcHFyc3R1dnd4eXp7fH1-fw";

po::variables_map with_keys() {
  po::variables_map vm;
  vm.emplace("pwd-key", po::variable_value(PWD_KEY, false));
  vm.emplace("token-key", po::variable_value(TOKEN_KEY, false));
  return vm;
}

}

TEST_CASE("Keys are required", "[options]") {
  po::variables_map vm;
  REQUIRE_THROWS_AS(auth_settings_via_options(vm), std::invalid_argument);

  vm.emplace("pwd-key", po::variable_value(PWD_KEY, false));
  REQUIRE_THROWS_AS(auth_settings_via_options(vm), std::invalid_argument);
}

TEST_CASE("Keys and defaults", "[options]") {
  auto vm = with_keys();
  auth_settings_via_options settings(vm);

  CHECK(settings.get_pwd_key().size() == SECRET_KEY_LENGTH);
  CHECK(settings.get_pwd_key()[1] == '\x01');
  CHECK(settings.get_token_key()[0] == '\x40');
  CHECK(settings.get_token_duration_sec() == 1800.0);
  CHECK(settings.get_hash_workers() == 2);
  CHECK(settings.get_hash_queue_max() == 64);
  CHECK(settings.get_hash_timeout() == std::chrono::milliseconds(10000));
  CHECK(settings.get_payload_max_size() == 50000);
}

TEST_CASE("Explicit values", "[options]") {
  auto vm = with_keys();
  vm.emplace("token-duration-sec", po::variable_value(60.5, false));
  vm.emplace("hash-workers", po::variable_value(4, false));
  vm.emplace("hash-queue-max", po::variable_value(8, false));
  vm.emplace("hash-timeout", po::variable_value(250L, false));
  vm.emplace("max-payload", po::variable_value(1024L, false));

  auth_settings_via_options settings(vm);
  CHECK(settings.get_token_duration_sec() == 60.5);
  CHECK(settings.get_hash_workers() == 4);
  CHECK(settings.get_hash_queue_max() == 8);
  CHECK(settings.get_hash_timeout() == std::chrono::milliseconds(250));
  CHECK(settings.get_payload_max_size() == 1024);
}

TEST_CASE("Invalid pwd-key", "[options]") {
  po::variables_map vm;
  vm.emplace("token-key", po::variable_value(TOKEN_KEY, false));

  SECTION("not base64url") {
    vm.emplace("pwd-key", po::variable_value(std::string("AAEC+/=="), false));
    REQUIRE_THROWS_AS(auth_settings_via_options(vm), std::invalid_argument);
  }

  SECTION("too short") {
    vm.emplace("pwd-key", po::variable_value(std::string("AAECAwQFBgcICQoLDA0ODw"), false));
    REQUIRE_THROWS_AS(auth_settings_via_options(vm), std::invalid_argument);
  }
}

TEST_CASE("Invalid token-duration-sec", "[options]") {
  auto vm = with_keys();

  SECTION("zero") {
    vm.emplace("token-duration-sec", po::variable_value(0.0, false));
    REQUIRE_THROWS_AS(auth_settings_via_options(vm), std::invalid_argument);
  }

  SECTION("longer than a year") {
    vm.emplace("token-duration-sec", po::variable_value(1e20, false));
    REQUIRE_THROWS_AS(auth_settings_via_options(vm), std::invalid_argument);
  }
}

TEST_CASE("token-duration-sec of exactly a year", "[options]") {
  auto vm = with_keys();
  vm.emplace("token-duration-sec", po::variable_value(MAX_TOKEN_DURATION_SEC, false));
  auth_settings_via_options settings(vm);
  CHECK(settings.get_token_duration_sec() == MAX_TOKEN_DURATION_SEC);
}

TEST_CASE("CORS origins", "[options]") {
  auto vm = with_keys();

  SECTION("none by default") {
    auth_settings_via_options settings(vm);
    CHECK(settings.get_cors_origins().empty());
  }

  SECTION("listed") {
    vm.emplace("cors-origin", po::variable_value(std::vector<std::string>{
      "https://app.example.com", "http://localhost:8080" }, false));
    auth_settings_via_options settings(vm);
    const std::set<std::string> expected{ "http://localhost:8080", "https://app.example.com" };
    CHECK(settings.get_cors_origins() == expected);
  }

  SECTION("with a path") {
    vm.emplace("cors-origin", po::variable_value(std::vector<std::string>{ "https://app.example.com/" }, false));
    REQUIRE_THROWS_AS(auth_settings_via_options(vm), std::invalid_argument);
  }

  SECTION("without a scheme") {
    vm.emplace("cors-origin", po::variable_value(std::vector<std::string>{ "app.example.com" }, false));
    REQUIRE_THROWS_AS(auth_settings_via_options(vm), std::invalid_argument);
  }
}

TEST_CASE("Invalid hash-workers", "[options]") {
  auto vm = with_keys();
  vm.emplace("hash-workers", po::variable_value(0, false));
  REQUIRE_THROWS_AS(auth_settings_via_options(vm), std::invalid_argument);
}

TEST_CASE("Invalid hash-queue-max", "[options]") {
  auto vm = with_keys();
  vm.emplace("hash-queue-max", po::variable_value(-3, false));
  REQUIRE_THROWS_AS(auth_settings_via_options(vm), std::invalid_argument);
}

TEST_CASE("Invalid hash-timeout", "[options]") {
  auto vm = with_keys();
  vm.emplace("hash-timeout", po::variable_value(0L, false));
  REQUIRE_THROWS_AS(auth_settings_via_options(vm), std::invalid_argument);
}

TEST_CASE("Invalid max-payload", "[options]") {
  auto vm = with_keys();
  vm.emplace("max-payload", po::variable_value((long) -1, false));
  REQUIRE_THROWS_AS(auth_settings_via_options(vm), std::invalid_argument);
}

TEST_CASE("Fallback settings", "[options]") {
  auto vm = with_keys();
  auth_settings_via_options first(vm);

  po::variables_map vm2;
  vm2.emplace("hash-workers", po::variable_value(7, false));
  auth_settings_via_options second(vm2, first);

  CHECK(second.get_pwd_key() == first.get_pwd_key());
  CHECK(second.get_hash_workers() == 7);
}
