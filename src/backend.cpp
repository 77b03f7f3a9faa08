/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/backend.hpp"

#include <map>
#include <memory>
#include <stdexcept>

#include <fmt/core.h>

namespace po = boost::program_options;


namespace {

struct registry {
  registry() = default;

  bool add(std::unique_ptr<backend> ptr);
  void setup_options(po::options_description &desc);
  void output_options(std::ostream &out);
  std::unique_ptr<user_store::factory> create(const po::variables_map &options);

private:
  std::map<std::string, std::unique_ptr<backend> > backends;
  std::string default_backend;
};

bool registry::add(std::unique_ptr<backend> ptr) {
  const std::string name = ptr->name();
  if (backends.contains(name))
    return false;

  // the first backend registered is the default
  if (backends.empty())
    default_backend = name;

  backends.emplace(name, std::move(ptr));
  return true;
}

void registry::setup_options(po::options_description &desc) {
  if (backends.empty())
    throw std::runtime_error("No backends available - this is most likely a "
                             "compile-time configuration error.");

  std::string description = "backend to use, available options are: ";
  for (const auto &[name, be] : backends)
    description += name + " ";

  desc.add_options()("backend", po::value<std::string>()->default_value(default_backend),
                     description.c_str());

  for (const auto &[name, be] : backends)
    desc.add(be->options());
}

void registry::output_options(std::ostream &out) {
  for (const auto &[name, be] : backends)
    out << be->options() << std::endl;
}

std::unique_ptr<user_store::factory>
registry::create(const po::variables_map &options) {
  const auto name = options.count("backend") ? options["backend"].as<std::string>()
                                             : default_backend;
  auto itr = backends.find(name);
  if (itr == backends.end())
    throw std::runtime_error(fmt::format("unknown backend '{}' provided", name));

  return itr->second->create(options);
}

registry &get_registry() {
  static registry r;
  return r;
}

} // anonymous namespace

backend::~backend() = default;

bool register_backend(std::unique_ptr<backend> ptr) {
  return get_registry().add(std::move(ptr));
}

void setup_backend_options(po::options_description &desc) {
  get_registry().setup_options(desc);
}

void output_backend_options(std::ostream &out) {
  get_registry().output_options(out);
}

std::unique_ptr<user_store::factory>
create_backend(const po::variables_map &options) {
  return get_registry().create(options);
}
