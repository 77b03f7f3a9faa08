/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/api/session_handler.hpp"
#include "authgate/auth_context.hpp"
#include "authgate/json_response.hpp"
#include "authgate/request_context.hpp"

namespace api {

session_handler::session_handler()
  : handler(http::method::GET, true) {}

std::string session_handler::log_name() const { return "session"; }

void session_handler::handle(RequestContext &req_ctx) const {
  const auto &c = require_ctx(req_ctx.auth);
  const auto user_id = c.user_id();

  respond_result(req_ctx.req, [user_id](json_writer &w) {
    w.property("user_id", user_id);
  });
}

} // namespace api
