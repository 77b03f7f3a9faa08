/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef API_LOGOFF_HANDLER_HPP
#define API_LOGOFF_HANDLER_HPP

#include "authgate/handler.hpp"

#include <string>

namespace api {

// POST /api/logoff with {"logoff": true|false}
class logoff_handler : public handler {
public:
  logoff_handler();
  ~logoff_handler() override = default;

  std::string log_name() const override;
  void handle(RequestContext &req_ctx) const override;
};

} // namespace api

#endif /* API_LOGOFF_HANDLER_HPP */
