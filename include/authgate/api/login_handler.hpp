/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef API_LOGIN_HANDLER_HPP
#define API_LOGIN_HANDLER_HPP

#include "authgate/handler.hpp"

#include <string>

namespace api {

/**
 * POST /api/login with {"username": ..., "pwd": ...}. Sets the
 * auth-token cookie on success.
 */
class login_handler : public handler {
public:
  login_handler();
  ~login_handler() override = default;

  std::string log_name() const override;
  void handle(RequestContext &req_ctx) const override;
};

} // namespace api

#endif /* API_LOGIN_HANDLER_HPP */
