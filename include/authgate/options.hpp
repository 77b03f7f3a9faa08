/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef OPTIONS_HPP
#define OPTIONS_HPP

#include <chrono>
#include <cstdint>
#include <set>
#include <string>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

// length in bytes of the password and token secrets
constexpr std::size_t SECRET_KEY_LENGTH = 64;

// longest accepted session token lifetime, one year
constexpr double MAX_TOKEN_DURATION_SEC = 365.0 * 24 * 60 * 60;

class auth_settings_base {

public:
  virtual ~auth_settings_base();

  // raw key bytes, not the base64url text
  virtual const std::string &get_pwd_key() const = 0;
  virtual const std::string &get_token_key() const = 0;
  virtual double get_token_duration_sec() const = 0;
  virtual uint32_t get_hash_workers() const = 0;
  virtual uint32_t get_hash_queue_max() const = 0;
  virtual std::chrono::milliseconds get_hash_timeout() const = 0;
  virtual uint32_t get_payload_max_size() const = 0;
  // origins which may make credentialed cross-origin calls
  virtual const std::set<std::string> &get_cors_origins() const = 0;
};

class auth_settings_default : public auth_settings_base {

public:
  // there is no usable default for a secret
  const std::string &get_pwd_key() const override {
    return m_no_key;
  }

  const std::string &get_token_key() const override {
    return m_no_key;
  }

  double get_token_duration_sec() const override {
    return 1800.0;  // 30 minutes
  }

  uint32_t get_hash_workers() const override {
    return 2;
  }

  uint32_t get_hash_queue_max() const override {
    return 64;
  }

  std::chrono::milliseconds get_hash_timeout() const override {
    return std::chrono::milliseconds(10000);
  }

  uint32_t get_payload_max_size() const override {
    return 50000;
  }

  // no cross-origin access unless configured
  const std::set<std::string> &get_cors_origins() const override {
    return m_no_origins;
  }

private:
  std::string m_no_key;
  std::set<std::string> m_no_origins;
};

class auth_settings_via_options : public auth_settings_base {

public:
  auth_settings_via_options() = delete;

  explicit auth_settings_via_options(const po::variables_map & options) {

    init_fallback_values(auth_settings_default{}); // use default values as fallback
    set_new_options(options);
  }

  auth_settings_via_options(const po::variables_map & options,
                            const auth_settings_base & fallback) {

    init_fallback_values(fallback);
    set_new_options(options);
  }

  const std::string &get_pwd_key() const override {
    return m_pwd_key;
  }

  const std::string &get_token_key() const override {
    return m_token_key;
  }

  double get_token_duration_sec() const override {
    return m_token_duration_sec;
  }

  uint32_t get_hash_workers() const override {
    return m_hash_workers;
  }

  uint32_t get_hash_queue_max() const override {
    return m_hash_queue_max;
  }

  std::chrono::milliseconds get_hash_timeout() const override {
    return m_hash_timeout;
  }

  uint32_t get_payload_max_size() const override {
    return m_payload_max_size;
  }

  const std::set<std::string> &get_cors_origins() const override {
    return m_cors_origins;
  }

private:
  void init_fallback_values(const auth_settings_base &def);
  void set_new_options(const po::variables_map &options);
  void set_pwd_key(const po::variables_map &options);
  void set_token_key(const po::variables_map &options);
  void set_token_duration_sec(const po::variables_map &options);
  void set_hash_workers(const po::variables_map &options);
  void set_hash_queue_max(const po::variables_map &options);
  void set_hash_timeout(const po::variables_map &options);
  void set_payload_max_size(const po::variables_map &options);
  void set_cors_origins(const po::variables_map &options);
  void check_keys() const;

  std::string m_pwd_key;
  std::string m_token_key;
  double m_token_duration_sec;
  uint32_t m_hash_workers;
  uint32_t m_hash_queue_max;
  std::chrono::milliseconds m_hash_timeout;
  uint32_t m_payload_max_size;
  std::set<std::string> m_cors_origins;
};

// decodes a base64url secret and checks its length, throwing
// std::invalid_argument naming the option on failure.
std::string decode_secret_key(const std::string &option_name, const std::string &b64u_text);

#endif
