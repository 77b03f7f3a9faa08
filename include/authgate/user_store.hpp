/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef USER_STORE_HPP
#define USER_STORE_HPP

#include "authgate/backend/apidb/transaction_manager.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/uuid/uuid.hpp>

namespace pwd {
class password_hasher;
}

class user_store_error : public std::runtime_error {
public:
  explicit user_store_error(const std::string &message) : std::runtime_error(message) {}
};

struct user_for_login {
  int64_t id;
  std::string username;
  // stored hash, "#<scheme>#<blob>". missing for users who can't log in.
  std::optional<std::string> pwd;
  boost::uuids::uuid pwd_salt;
  boost::uuids::uuid token_salt;
};

struct user_for_auth {
  int64_t id;
  std::string username;
  boost::uuids::uuid token_salt;
};

/**
 * Access to the users table. Every operation may throw
 * user_store_error when the store itself fails.
 */
class user_store {
public:
  virtual ~user_store() = default;

  virtual std::optional<user_for_auth> first_for_auth_by_username(const std::string &username) = 0;

  virtual std::optional<user_for_login> first_for_login_by_username(const std::string &username) = 0;

  // throws user_store_error if there is no such user.
  virtual user_for_login get_for_login(int64_t id) = 0;

  // stores a new hash and commits. should be the last call on the store.
  virtual void update_pwd(int64_t id, const std::string &stored_pwd) = 0;

  /**
   * creates one store per request, on the transaction returned by
   * get_default_transaction().
   */
  struct factory {
    virtual ~factory() = default;

    factory() = default;

    factory(const factory&) = delete;
    factory& operator=(const factory&) = delete;

    factory(factory&&) = delete;
    factory& operator=(factory&&) = delete;

    virtual std::unique_ptr<user_store> make_user_store(Transaction_Owner_Base&) const = 0;

    virtual std::unique_ptr<Transaction_Owner_Base> get_default_transaction() = 0;
  };
};

/**
 * Stand-in for a store which could not be set up, e.g. because the
 * database is unreachable. Every operation throws user_store_error.
 */
class unavailable_user_store : public user_store {
public:
  explicit unavailable_user_store(std::string reason) : m_reason(std::move(reason)) {}

  std::optional<user_for_auth> first_for_auth_by_username(const std::string &) override;
  std::optional<user_for_login> first_for_login_by_username(const std::string &) override;
  user_for_login get_for_login(int64_t) override;
  void update_pwd(int64_t, const std::string &) override;

private:
  [[noreturn]] void fail() const;

  std::string m_reason;
};

// hashes the clear password with the user's pwd_salt under the default
// scheme and stores it.
void update_user_pwd(user_store &store, pwd::password_hasher &hasher,
                     int64_t id, const std::string &clear_pwd);

#endif /* USER_STORE_HPP */
