/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/backend/apidb/apidb.hpp"
#include "authgate/backend/apidb/pgsql_user_store.hpp"
#include "authgate/backend.hpp"

#include <memory>

namespace po = boost::program_options;


namespace {
struct apidb_backend : public backend {
  apidb_backend() {
    // clang-format off
    m_options.add_options()
      ("dbname", po::value<std::string>(), "database name")
      ("host", po::value<std::string>(), "database server host")
      ("username", po::value<std::string>(), "database user name")
      ("password", po::value<std::string>(), "database password")
      ("dbport", po::value<std::string>(),
       "database port number or UNIX socket file name");
    // clang-format on
  }
  ~apidb_backend() override = default;

  [[nodiscard]] const std::string &name() const override { return m_name; }
  [[nodiscard]] const po::options_description &options() const override { return m_options; }

  std::unique_ptr<user_store::factory> create(const po::variables_map &opts) override {
    return std::make_unique<pgsql_user_store::factory>(opts);
  }

private:
  std::string m_name{"apidb"};
  po::options_description m_options{"ApiDB backend options"};
};
}

std::unique_ptr<backend> make_apidb_backend() {
  return std::make_unique<apidb_backend>();
}
