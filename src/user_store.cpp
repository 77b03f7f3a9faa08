/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/user_store.hpp"
#include "authgate/pwd/password_hasher.hpp"

#include <fmt/core.h>

std::optional<user_for_auth>
unavailable_user_store::first_for_auth_by_username(const std::string &) {
  fail();
}

std::optional<user_for_login>
unavailable_user_store::first_for_login_by_username(const std::string &) {
  fail();
}

user_for_login unavailable_user_store::get_for_login(int64_t) {
  fail();
}

void unavailable_user_store::update_pwd(int64_t, const std::string &) {
  fail();
}

void unavailable_user_store::fail() const {
  throw user_store_error(fmt::format("user store unavailable: {}", m_reason));
}

void update_user_pwd(user_store &store, pwd::password_hasher &hasher,
                     int64_t id, const std::string &clear_pwd) {
  const auto user = store.get_for_login(id);
  const auto stored = hasher.hash_pwd(pwd::content_to_hash{ clear_pwd, user.pwd_salt });
  store.update_pwd(id, stored);
}
