/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/cookies.hpp"
#include "authgate/util.hpp"

#include <string_view>

#include <boost/uuid/uuid_io.hpp>
#include <fmt/core.h>


std::map<std::string, std::string> parse_cookie_header(const std::string &header) {
  std::map<std::string, std::string> result;

  for (const auto &pair : split_trim(std::string_view(header), ';')) {
    const auto eq = pair.find('=');
    if (eq == std::string_view::npos || eq == 0)
      continue;

    auto name = trim(pair.substr(0, eq));
    auto value = trim(pair.substr(eq + 1));

    if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
      value = value.substr(1, value.size() - 2);

    result.emplace(std::string(name), std::string(value));
  }

  return result;
}


request_cookie_store::request_cookie_store(request &req)
  : m_req(req) {
  const char *header = req.get_param("HTTP_COOKIE");
  if (header != nullptr)
    m_cookies = parse_cookie_header(header);
}

std::optional<std::string> request_cookie_store::get(const std::string &name) const {
  auto itr = m_cookies.find(name);
  if (itr == m_cookies.end())
    return std::nullopt;
  return itr->second;
}

void request_cookie_store::set(const std::string &name, const std::string &value) {
  add_set_cookie(fmt::format("{}={}; HttpOnly; Path=/", name, value));
  m_cookies[name] = value;
}

void request_cookie_store::remove(const std::string &name) {
  add_set_cookie(fmt::format("{}=; HttpOnly; Path=/; Max-Age=0; "
                             "Expires=Thu, 01 Jan 1970 00:00:00 GMT", name));
  m_cookies.erase(name);
}

void request_cookie_store::add_set_cookie(const std::string &header_value) {
  if (m_req.headers_committed())
    throw cookie_error("response headers already sent, cannot write cookie");
  m_req.add_header("Set-Cookie", header_value);
}


void set_token_cookie(cookie_store &cookies, const token::token_signer &signer,
                      const std::string &username, const boost::uuids::uuid &token_salt,
                      std::chrono::system_clock::time_point now) {
  const auto t = signer.generate_web_token(username, boost::uuids::to_string(token_salt), now);
  cookies.set(AUTH_TOKEN, token::to_string(t));
}

void remove_token_cookie(cookie_store &cookies) {
  cookies.remove(AUTH_TOKEN);
}
