/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/options.hpp"
#include "authgate/base64.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/core.h>

auth_settings_base::~auth_settings_base() = default;


std::string decode_secret_key(const std::string &option_name, const std::string &b64u_text) {

  std::string key;

  try {
    key = b64u::decode(b64u_text);
  } catch (const b64u::decode_error &e) {
    throw std::invalid_argument(fmt::format("{} is not valid base64url: {}", option_name, e.what()));
  }

  if (key.size() != SECRET_KEY_LENGTH)
    throw std::invalid_argument(fmt::format("{} must decode to {:d} bytes, got {:d}",
                                            option_name, SECRET_KEY_LENGTH, key.size()));
  return key;
}

void auth_settings_via_options::init_fallback_values(const auth_settings_base &def) {

  m_pwd_key = def.get_pwd_key();
  m_token_key = def.get_token_key();
  m_token_duration_sec = def.get_token_duration_sec();
  m_hash_workers = def.get_hash_workers();
  m_hash_queue_max = def.get_hash_queue_max();
  m_hash_timeout = def.get_hash_timeout();
  m_payload_max_size = def.get_payload_max_size();
  m_cors_origins = def.get_cors_origins();
}

void auth_settings_via_options::set_new_options(const po::variables_map &options) {

  set_pwd_key(options);
  set_token_key(options);
  set_token_duration_sec(options);
  set_hash_workers(options);
  set_hash_queue_max(options);
  set_hash_timeout(options);
  set_payload_max_size(options);
  set_cors_origins(options);
  check_keys();
}

void auth_settings_via_options::set_pwd_key(const po::variables_map &options) {
  if (options.count("pwd-key")) {
    m_pwd_key = decode_secret_key("pwd-key", options["pwd-key"].as<std::string>());
  }
}

void auth_settings_via_options::set_token_key(const po::variables_map &options) {
  if (options.count("token-key")) {
    m_token_key = decode_secret_key("token-key", options["token-key"].as<std::string>());
  }
}

void auth_settings_via_options::set_token_duration_sec(const po::variables_map &options) {
  if (options.count("token-duration-sec")) {
    m_token_duration_sec = options["token-duration-sec"].as<double>();
    if (!std::isfinite(m_token_duration_sec) || m_token_duration_sec <= 0)
      throw std::invalid_argument("token-duration-sec must be a positive number");
    if (m_token_duration_sec > MAX_TOKEN_DURATION_SEC)
      throw std::invalid_argument(fmt::format("token-duration-sec must not exceed {:.0f} seconds",
                                              MAX_TOKEN_DURATION_SEC));
  }
}

void auth_settings_via_options::set_hash_workers(const po::variables_map &options) {
  if (options.count("hash-workers")) {
    auto hash_workers = options["hash-workers"].as<int>();
    if (hash_workers <= 0)
      throw std::invalid_argument("hash-workers must be a positive number");
    m_hash_workers = hash_workers;
  }
}

void auth_settings_via_options::set_hash_queue_max(const po::variables_map &options) {
  if (options.count("hash-queue-max")) {
    auto hash_queue_max = options["hash-queue-max"].as<int>();
    if (hash_queue_max <= 0)
      throw std::invalid_argument("hash-queue-max must be a positive number");
    m_hash_queue_max = hash_queue_max;
  }
}

void auth_settings_via_options::set_hash_timeout(const po::variables_map &options) {
  if (options.count("hash-timeout")) {
    auto hash_timeout = options["hash-timeout"].as<long>();
    if (hash_timeout <= 0)
      throw std::invalid_argument("hash-timeout must be a positive number of milliseconds");
    m_hash_timeout = std::chrono::milliseconds(hash_timeout);
  }
}

void auth_settings_via_options::set_payload_max_size(const po::variables_map &options) {
  if (options.count("max-payload")) {
    auto payload_max_size = options["max-payload"].as<long>();
    if (payload_max_size <= 0)
      throw std::invalid_argument("max-payload must be a positive number");
    m_payload_max_size = payload_max_size;
  }
}

// an origin is matched exactly against the Origin request header, so it
// must be a bare scheme://host[:port] without a path.
void auth_settings_via_options::set_cors_origins(const po::variables_map &options) {
  if (options.count("cors-origin")) {
    std::set<std::string> origins;
    for (const auto &origin : options["cors-origin"].as<std::vector<std::string>>()) {
      const auto scheme_end = origin.find("://");
      if (scheme_end == std::string::npos || scheme_end == 0 ||
          origin.size() == scheme_end + 3 ||
          origin.find('/', scheme_end + 3) != std::string::npos)
        throw std::invalid_argument(fmt::format("cors-origin '{}' must look like https://host[:port]", origin));
      origins.insert(origin);
    }
    m_cors_origins = std::move(origins);
  }
}

// both secrets must be set once all sources have been applied
void auth_settings_via_options::check_keys() const {
  if (m_pwd_key.empty())
    throw std::invalid_argument("pwd-key is required");

  if (m_token_key.empty())
    throw std::invalid_argument("token-key is required");
}
