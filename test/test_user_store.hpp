/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef TEST_TEST_USER_STORE_HPP
#define TEST_TEST_USER_STORE_HPP

#include "authgate/user_store.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <fmt/core.h>

/**
 * users kept in memory, shared by all stores made by one factory.
 */
struct test_user_table {
  std::map<int64_t, user_for_login> users;
  // set to make every call fail as if the database was gone
  bool broken = false;
  // set to make opening the per-request transaction fail
  bool unreachable = false;
  int pwd_updates = 0;

  void add(const user_for_login &u) { users[u.id] = u; }
};

class test_user_store : public user_store {
public:
  explicit test_user_store(test_user_table &table) : m_table(table) {}

  std::optional<user_for_auth> first_for_auth_by_username(const std::string &username) override {
    check();
    for (const auto &[id, u] : m_table.users) {
      if (u.username == username)
        return user_for_auth{ u.id, u.username, u.token_salt };
    }
    return std::nullopt;
  }

  std::optional<user_for_login> first_for_login_by_username(const std::string &username) override {
    check();
    for (const auto &[id, u] : m_table.users) {
      if (u.username == username)
        return u;
    }
    return std::nullopt;
  }

  user_for_login get_for_login(int64_t id) override {
    check();
    auto itr = m_table.users.find(id);
    if (itr == m_table.users.end())
      throw user_store_error(fmt::format("no user with id {}", id));
    return itr->second;
  }

  void update_pwd(int64_t id, const std::string &stored_pwd) override {
    check();
    auto itr = m_table.users.find(id);
    if (itr == m_table.users.end())
      throw user_store_error(fmt::format("no user with id {}", id));
    itr->second.pwd = stored_pwd;
    ++m_table.pwd_updates;
  }

private:
  void check() const {
    if (m_table.broken)
      throw user_store_error("connection lost");
  }

  test_user_table &m_table;
};

class test_user_store_factory : public user_store::factory {
public:
  explicit test_user_store_factory(test_user_table &table) : m_table(table) {}

  std::unique_ptr<user_store> make_user_store(Transaction_Owner_Base&) const override {
    return std::make_unique<test_user_store>(m_table);
  }

  std::unique_ptr<Transaction_Owner_Base> get_default_transaction() override {
    if (m_table.unreachable)
      throw std::runtime_error("could not connect to server");
    return std::make_unique<Transaction_Owner_Void>();
  }

private:
  test_user_table &m_table;
};

#endif /* TEST_TEST_USER_STORE_HPP */
