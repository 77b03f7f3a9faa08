/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef ROUTES_HPP
#define ROUTES_HPP

#include "authgate/handler.hpp"

#include <memory>
#include <string>

// internal implementation of the routes
struct router;
struct request;

/**
 * encapsulates routing (URL to handler mapping) information.
 */
class routes {
public:
  routes();
  ~routes();

  routes(const routes &) = delete;
  routes& operator=(const routes &) = delete;
  routes(routes &&) = default;
  routes& operator=(routes &&) = default;

  /**
   * returns the handler which matches a request, or throws a 404 error.
   * throws a 405 error if the path is known but the method isn't.
   */
  handler_ptr_t operator()(request &req) const;

private:
  static std::unique_ptr<router> get_default_router();

  // common prefix of all routes
  std::string common_prefix;

  // object which actually does the routing.
  std::unique_ptr<router> r;
};

#endif /* ROUTES_HPP */
