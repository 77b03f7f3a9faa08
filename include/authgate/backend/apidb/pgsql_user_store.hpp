/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef PGSQL_USER_STORE_HPP
#define PGSQL_USER_STORE_HPP

#include "authgate/user_store.hpp"
#include "authgate/backend/apidb/transaction_manager.hpp"

#include <boost/program_options.hpp>
#include <pqxx/pqxx>

#include <memory>
#include <set>
#include <string>

/**
 * user_store on the "user" table of a PostgreSQL database.
 */
class pgsql_user_store : public user_store {
public:
  explicit pgsql_user_store(Transaction_Owner_Base &to);
  ~pgsql_user_store() override = default;

  std::optional<user_for_auth> first_for_auth_by_username(const std::string &username) override;
  std::optional<user_for_login> first_for_login_by_username(const std::string &username) override;
  user_for_login get_for_login(int64_t id) override;
  void update_pwd(int64_t id, const std::string &stored_pwd) override;

  class factory : public user_store::factory {
  public:
    explicit factory(const boost::program_options::variables_map &);
    ~factory() override = default;
    std::unique_ptr<user_store> make_user_store(Transaction_Owner_Base&) const override;
    std::unique_ptr<Transaction_Owner_Base> get_default_transaction() override;

  private:
    pqxx::connection m_connection;
    std::set<std::string> m_prep_stmt;
  };

private:
  Transaction_Manager m;
};

#endif /* PGSQL_USER_STORE_HPP */
