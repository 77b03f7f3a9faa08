/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef AUTHGATE_BACKEND_APIDB_UTILS_HPP
#define AUTHGATE_BACKEND_APIDB_UTILS_HPP

#include <string>

#include <boost/program_options.hpp>
#include <boost/uuid/uuid.hpp>
#include <pqxx/pqxx>

// throws std::runtime_error for a server older than 9.4.
void check_postgres_version(pqxx::connection &conn);

// libpq connection string from --dbname, --host, --username,
// --password and --dbport.
std::string connect_db_str(const boost::program_options::variables_map &options);

// throws std::runtime_error when the field does not hold a uuid.
boost::uuids::uuid field_to_uuid(const pqxx::field &field);

#endif /* AUTHGATE_BACKEND_APIDB_UTILS_HPP */
