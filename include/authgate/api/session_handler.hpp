/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef API_SESSION_HANDLER_HPP
#define API_SESSION_HANDLER_HPP

#include "authgate/handler.hpp"

#include <string>

namespace api {

// GET /api/session, the id of the authenticated user
class session_handler : public handler {
public:
  session_handler();
  ~session_handler() override = default;

  std::string log_name() const override;
  void handle(RequestContext &req_ctx) const override;
};

} // namespace api

#endif /* API_SESSION_HANDLER_HPP */
