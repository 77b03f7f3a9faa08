/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef HANDLER_HPP
#define HANDLER_HPP

#include "authgate/http.hpp"

#include <memory>
#include <string>

struct RequestContext;

/**
 * object which is able to respond to an already-setup request.
 */
class handler {
public:
  handler(http::method methods, bool requires_auth);
  virtual ~handler() = default;

  virtual std::string log_name() const = 0;

  // reads the request and writes the complete response.
  virtual void handle(RequestContext &req_ctx) const = 0;

  // returns true if the given method is allowed on this handler.
  constexpr bool allows_method(http::method m) const {
    return (m & m_allowed_methods) == m;
  }

  // returns the set of methods which are allowed on this handler.
  constexpr http::method allowed_methods() const {
    return m_allowed_methods;
  }

  // true if the request needs a resolved auth context.
  bool requires_auth() const {
    return m_requires_auth;
  }

protected:
  http::method m_allowed_methods;
  bool m_requires_auth;
};

using handler_ptr_t = std::unique_ptr<handler>;

#endif /* HANDLER_HPP */
