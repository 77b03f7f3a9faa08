/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/request_helpers.hpp"
#include "authgate/util.hpp"

#include <algorithm>
#include <cstring>
#include <string_view>

#include <fmt/core.h>


std::string fcgi_get_env(const request &req, const char *name, const char *default_value) {
  const char *v = req.get_param(name);

  if (v == nullptr) {
    if (default_value) {
      v = default_value;
    } else {
      throw http::server_error(fmt::format("request didn't set the ${} environment variable.", name));
    }
  }

  return std::string(v);
}

std::string get_request_path(const request &req) {
  const char *request_uri = req.get_param("REQUEST_URI");

  if ((request_uri == nullptr) || (strlen(request_uri) == 0)) {
    // fall back to PATH_INFO if REQUEST_URI isn't available.
    request_uri = req.get_param("PATH_INFO");
  }

  if ((request_uri == nullptr) || (strlen(request_uri) == 0)) {
    throw http::server_error("request didn't set the $REQUEST_URI or $PATH_INFO environment variables.");
  }

  const char *request_uri_end = request_uri + strlen(request_uri);
  auto *question_mark = std::find(request_uri, request_uri_end, '?');
  return {request_uri, question_mark};
}

bool has_json_content_type(const request &req) {
  const char *content_type = req.get_param("CONTENT_TYPE");
  if (content_type == nullptr)
    return false;

  std::string_view ct(content_type);
  ct = trim(ct.substr(0, ct.find(';')));
  return iequals(ct, "application/json");
}
