/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef BACKEND_HPP
#define BACKEND_HPP

#include "authgate/user_store.hpp"

#include <memory>
#include <ostream>
#include <string>

#include <boost/program_options.hpp>

/* implement this interface to add a new backend which will be selectable
 * on the command line.
 */
struct backend {
  virtual ~backend();
  // the name of the backend, used as the option argument to select this in
  // --backend=
  virtual const std::string &name() const = 0;
  // the options that this backend can take. these are matched to command line
  // arguments and environment variables and passed into create() as a
  // variables_map.
  virtual const boost::program_options::options_description &
  options() const = 0;
  // create a user store factory from the arguments passed to authgate.
  virtual std::unique_ptr<user_store::factory>
  create(const boost::program_options::variables_map &) = 0;
};

// adds --backend and the options of every registered backend to the
// options description.
void setup_backend_options(boost::program_options::options_description &);
// prints the options for all backends.
void output_backend_options(std::ostream &);
// creates the user store factory of the backend selected by --backend.
std::unique_ptr<user_store::factory>
create_backend(const boost::program_options::variables_map &);

// this function registers a backend for use when creating backends
// from user-provided options. returns false if the name is taken.
bool register_backend(std::unique_ptr<backend>);

#endif /* BACKEND_HPP */
