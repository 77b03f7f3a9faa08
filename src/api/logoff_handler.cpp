/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/api/logoff_handler.hpp"
#include "authgate/cookies.hpp"
#include "authgate/json_payload.hpp"
#include "authgate/json_response.hpp"
#include "authgate/request_context.hpp"
#include "authgate/request_helpers.hpp"

namespace api {

logoff_handler::logoff_handler()
  : handler(http::method::POST, false) {}

std::string logoff_handler::log_name() const { return "logoff"; }

void logoff_handler::handle(RequestContext &req_ctx) const {
  if (!has_json_content_type(req_ctx.req))
    throw http::unsupported_media_type("logoff expects an application/json body");

  const json_payload payload(req_ctx.req.get_payload());
  const auto logoff = payload.get_bool("logoff");

  if (!logoff)
    throw http::bad_request("logoff needs the boolean field logoff");

  if (*logoff) {
    try {
      remove_token_cookie(req_ctx.cookies);
    } catch (const cookie_error &e) {
      throw http::server_error(e.what());
    }
  }

  const bool logged_off = *logoff;
  respond_result(req_ctx.req, [logged_off](json_writer &w) {
    w.property("logged_off", logged_off);
  });
}

} // namespace api
