/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef COOKIES_HPP
#define COOKIES_HPP

#include "authgate/request.hpp"
#include "authgate/token.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

#include <boost/uuid/uuid.hpp>

// name of the cookie holding the session token
constexpr const char *AUTH_TOKEN = "auth-token";

class cookie_error : public std::runtime_error {
public:
  explicit cookie_error(const std::string &message) : std::runtime_error(message) {}
};

/**
 * Cookies of the current request and the changes to send back.
 * Cookies written by this store are HttpOnly with Path=/.
 */
class cookie_store {
public:
  virtual ~cookie_store() = default;

  virtual std::optional<std::string> get(const std::string &name) const = 0;

  // throws cookie_error when the cookie can't be sent any more.
  virtual void set(const std::string &name, const std::string &value) = 0;
  virtual void remove(const std::string &name) = 0;
};

/**
 * cookie_store on a request: reads $HTTP_COOKIE and writes Set-Cookie
 * response headers.
 */
class request_cookie_store : public cookie_store {
public:
  explicit request_cookie_store(request &req);

  std::optional<std::string> get(const std::string &name) const override;
  void set(const std::string &name, const std::string &value) override;
  void remove(const std::string &name) override;

private:
  void add_set_cookie(const std::string &header_value);

  request &m_req;
  std::map<std::string, std::string> m_cookies;
};

// parses a Cookie header. the first occurrence of a name wins.
std::map<std::string, std::string> parse_cookie_header(const std::string &header);

void set_token_cookie(cookie_store &cookies, const token::token_signer &signer,
                      const std::string &username, const boost::uuids::uuid &token_salt,
                      std::chrono::system_clock::time_point now);

void remove_token_cookie(cookie_store &cookies);

#endif /* COOKIES_HPP */
