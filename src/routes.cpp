/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/routes.hpp"
#include "authgate/handler.hpp"
#include "authgate/request_helpers.hpp"
#include "authgate/util.hpp"

#include "authgate/api/login_handler.hpp"
#include "authgate/api/logoff_handler.hpp"
#include "authgate/api/session_handler.hpp"

#include <string_view>
#include <vector>

#include <fmt/core.h>

/**
 * maps paths, split into their components, to handlers. the first
 * rule which matches wins.
 */
struct router {

  struct rule_base {
    virtual ~rule_base() = default;
    virtual handler_ptr_t invoke_if(const std::vector<std::string_view> &parts) const = 0;
  };

  template <typename Handler>
  struct rule : public rule_base {
    explicit rule(std::vector<std::string> p) : path(std::move(p)) {}

    handler_ptr_t invoke_if(const std::vector<std::string_view> &parts) const override {
      if (parts.size() != path.size())
        return nullptr;

      for (std::size_t i = 0; i < parts.size(); ++i) {
        if (parts[i] != path[i])
          return nullptr;
      }

      return std::make_unique<Handler>();
    }

  private:
    std::vector<std::string> path;
  };

  // add rule to match HTTP GET method only
  template <typename Handler>
  router& GET(std::vector<std::string> path) {
    rules_get.push_back(std::make_unique<rule<Handler> >(std::move(path)));
    return *this;
  }

  // add rule to match HTTP POST method only
  template <typename Handler>
  router& POST(std::vector<std::string> path) {
    rules_post.push_back(std::make_unique<rule<Handler> >(std::move(path)));
    return *this;
  }

  handler_ptr_t match(const std::vector<std::string_view> &p, request &params) const {

    http::method allowed_methods = http::method::OPTIONS;

    auto maybe_method = http::parse_method(fcgi_get_env(params, "REQUEST_METHOD"));

    if (!maybe_method)
      return nullptr;

    for (const auto &rptr : rules_get) {
      if (auto hptr = rptr->invoke_if(p); hptr) {
        if (*maybe_method == http::method::GET ||
            *maybe_method == http::method::OPTIONS)
          return hptr;
        allowed_methods |= http::method::GET;
      }
    }

    for (const auto &rptr : rules_post) {
      if (auto hptr = rptr->invoke_if(p); hptr) {
        if (*maybe_method == http::method::POST ||
            *maybe_method == http::method::OPTIONS)
          return hptr;
        allowed_methods |= http::method::POST;
      }
    }

    // the path matched a rule, but not for this method
    if (allowed_methods != http::method::OPTIONS) {
      throw http::method_not_allowed(allowed_methods);
    }

    return nullptr;
  }

private:
  using rule_ptr = std::unique_ptr<rule_base>;

  std::vector<rule_ptr> rules_get;
  std::vector<rule_ptr> rules_post;
};

routes::routes()
    : common_prefix("/api/"),
      r(get_default_router())
{
}

routes::~routes() = default;

std::unique_ptr<router> routes::get_default_router()
{
  auto r = std::make_unique<router>();

  using namespace api;
  r->POST<login_handler>({ "login" })
    .POST<logoff_handler>({ "logoff" })
    .GET<session_handler>({ "session" });

  return r;
}

handler_ptr_t routes::operator()(request &req) const {
  // full path from request handler
  auto path = get_request_path(req);
  handler_ptr_t hptr;

  if (path.starts_with(common_prefix)) {
    const auto resource = std::string_view(path).substr(common_prefix.size());
    hptr = r->match(split(resource, '/'), req);
  }

  if (!hptr) {
    throw http::not_found(fmt::format("Path does not match any known routes: {}", path));
  }

  return hptr;
}
