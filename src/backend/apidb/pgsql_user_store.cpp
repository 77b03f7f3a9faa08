/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/backend/apidb/pgsql_user_store.hpp"
#include "authgate/backend/apidb/utils.hpp"

#include <functional>

#include <fmt/core.h>

namespace po = boost::program_options;

namespace {

// runs a database call, reporting any failure as user_store_error.
template <typename F>
auto guarded(const char *operation, F &&f) {
  try {
    return f();
  } catch (const pqxx::failure &e) {
    throw user_store_error(fmt::format("{} failed: {}", operation, e.what()));
  } catch (const pqxx::conversion_error &e) {
    throw user_store_error(fmt::format("{} failed: {}", operation, e.what()));
  } catch (const std::runtime_error &e) {
    throw user_store_error(fmt::format("{} failed: {}", operation, e.what()));
  }
}

user_for_login row_to_login(const pqxx::row &row) {
  user_for_login user;
  user.id = row["id"].as<int64_t>();
  user.username = row["username"].as<std::string>();
  if (!row["pwd"].is_null())
    user.pwd = row["pwd"].as<std::string>();
  user.pwd_salt = field_to_uuid(row["pwd_salt"]);
  user.token_salt = field_to_uuid(row["token_salt"]);
  return user;
}

} // anonymous namespace

pgsql_user_store::pgsql_user_store(Transaction_Owner_Base &to)
  : m{ to } {

  m.prepare("user_for_login_by_username",
    R"(SELECT id, username, pwd, pwd_salt, token_salt
         FROM "user"
         WHERE username = $1
         LIMIT 1)");

  m.prepare("user_for_login_by_id",
    R"(SELECT id, username, pwd, pwd_salt, token_salt
         FROM "user"
         WHERE id = $1)");

  m.prepare("user_for_auth_by_username",
    R"(SELECT id, username, token_salt
         FROM "user"
         WHERE username = $1
         LIMIT 1)");

  m.prepare("update_user_pwd",
    R"(UPDATE "user" SET pwd = $2 WHERE id = $1)");
}

std::optional<user_for_auth>
pgsql_user_store::first_for_auth_by_username(const std::string &username) {
  return guarded("user lookup", [&]() -> std::optional<user_for_auth> {
    auto res = m.exec_prepared("user_for_auth_by_username", username);
    if (res.empty())
      return std::nullopt;

    const auto &row = res[0];
    return user_for_auth{
      row["id"].as<int64_t>(),
      row["username"].as<std::string>(),
      field_to_uuid(row["token_salt"])
    };
  });
}

std::optional<user_for_login>
pgsql_user_store::first_for_login_by_username(const std::string &username) {
  return guarded("user lookup", [&]() -> std::optional<user_for_login> {
    auto res = m.exec_prepared("user_for_login_by_username", username);
    if (res.empty())
      return std::nullopt;
    return row_to_login(res[0]);
  });
}

user_for_login pgsql_user_store::get_for_login(int64_t id) {
  auto user = guarded("user lookup", [&]() -> std::optional<user_for_login> {
    auto res = m.exec_prepared("user_for_login_by_id", id);
    if (res.empty())
      return std::nullopt;
    return row_to_login(res[0]);
  });

  if (!user)
    throw user_store_error(fmt::format("user {} not found", id));
  return *user;
}

void pgsql_user_store::update_pwd(int64_t id, const std::string &stored_pwd) {
  guarded("password update", [&]() {
    auto res = m.exec_prepared("update_user_pwd", id, stored_pwd);
    if (res.affected_rows() != 1)
      throw user_store_error(fmt::format("user {} not found", id));
    m.commit();
  });
}


pgsql_user_store::factory::factory(const po::variables_map &opts)
    : m_connection(connect_db_str(opts)) {

  check_postgres_version(m_connection);

  // set the connections to use the appropriate charset.
  m_connection.set_client_encoding("utf8");
}

std::unique_ptr<user_store>
pgsql_user_store::factory::make_user_store(Transaction_Owner_Base& to) const {
  return std::make_unique<pgsql_user_store>(to);
}

std::unique_ptr<Transaction_Owner_Base>
pgsql_user_store::factory::get_default_transaction()
{
  return std::make_unique<Transaction_Owner_ReadWrite>(std::ref(m_connection), m_prep_stmt);
}
