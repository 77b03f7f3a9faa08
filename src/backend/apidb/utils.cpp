/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/backend/apidb/utils.hpp"

#include <sstream>
#include <stdexcept>

#include <boost/uuid/string_generator.hpp>
#include <fmt/core.h>

namespace po = boost::program_options;

namespace {

void connopt(std::ostringstream &ostr, const po::variables_map &options,
    const std::string &param, const std::string &pg_param)
{
  if (options.count(param))
  {
    ostr << " " << pg_param << "=" << options[param].as< std::string >();
  }
}

} // anonymous namespace

void check_postgres_version(pqxx::connection &conn) {
  auto version = conn.server_version();
  if (version < 90400) {
    throw std::runtime_error("Expected Postgres version 9.4+, currently installed version "
      + std::to_string(version));
  }
}

std::string connect_db_str(const po::variables_map &options) {
  std::ostringstream ostr;

  if (options.count("dbname") == 0) {
    throw std::runtime_error("Must provide --dbname to configure the database name.");
  }

  connopt(ostr, options, "dbname", "dbname");
  connopt(ostr, options, "host", "host");
  connopt(ostr, options, "username", "user");
  connopt(ostr, options, "password", "password");
  connopt(ostr, options, "dbport", "port");

  return ostr.str();
}

boost::uuids::uuid field_to_uuid(const pqxx::field &field) {
  if (field.is_null())
    throw std::runtime_error(fmt::format("column {} is NULL, expected a uuid", field.name()));

  try {
    return boost::uuids::string_generator()(field.as<std::string>());
  } catch (const std::runtime_error &) {
    throw std::runtime_error(fmt::format("column {} does not hold a uuid", field.name()));
  }
}
