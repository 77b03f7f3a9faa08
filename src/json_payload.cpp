/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/json_payload.hpp"
#include "authgate/http.hpp"

#include <array>

#include <fmt/core.h>


json_payload::json_payload(const std::string &body) {
  std::array<char, 256> errbuf{};

  m_root.reset(yajl_tree_parse(body.c_str(), errbuf.data(), errbuf.size()));

  if (!m_root)
    throw http::bad_request(fmt::format("Invalid JSON payload: {}", errbuf.data()));

  if (!YAJL_IS_OBJECT(m_root.get()))
    throw http::bad_request("JSON payload must be an object");
}

yajl_val json_payload::member(const char *key) const {
  const char *path[] = { key, nullptr };
  return yajl_tree_get(m_root.get(), path, yajl_t_any);
}

std::optional<std::string> json_payload::get_string(const char *key) const {
  yajl_val v = member(key);
  if (v == nullptr || !YAJL_IS_STRING(v))
    return std::nullopt;
  return std::string(YAJL_GET_STRING(v));
}

std::optional<bool> json_payload::get_bool(const char *key) const {
  yajl_val v = member(key);
  if (v == nullptr)
    return std::nullopt;
  if (YAJL_IS_TRUE(v))
    return true;
  if (YAJL_IS_FALSE(v))
    return false;
  return std::nullopt;
}
