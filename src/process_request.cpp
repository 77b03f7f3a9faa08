/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/process_request.hpp"
#include "authgate/auth_context.hpp"
#include "authgate/cookies.hpp"
#include "authgate/http.hpp"
#include "authgate/json_response.hpp"
#include "authgate/logger.hpp"
#include "authgate/request_helpers.hpp"

#include <chrono>
#include <memory>

#include <fmt/core.h>


namespace {

void process_not_allowed(request &req, http::method allowed) {
  req.status(405)
     .add_header("Allow", http::list_methods(allowed))
     .add_header("Content-Type", "text/html")
     .add_header("Content-Length", "0")
     .add_header("Cache-Control", "no-cache")
     .finish();
}

/**
 * process an OPTIONS request.
 */
void process_options_request(request& req, const handler& handler) {

  const char *origin = req.get_param("HTTP_ORIGIN");
  const char *method = req.get_param("HTTP_ACCESS_CONTROL_REQUEST_METHOD");

  // NOTE: we don't echo back the method - the handler already lists all
  // the methods it understands.
  if (origin && method && req.cors_allowed()) {

    req.status(200)
       .add_header("Content-Type", "text/plain");

    // if extra headers were requested, then reply that we allow them too.
    const char *headers = req.get_param("HTTP_ACCESS_CONTROL_REQUEST_HEADERS");
    if (headers) {
      req.add_header("Access-Control-Allow-Headers", std::string(headers));
    }

    req.finish();

  } else {
    process_not_allowed(req, handler.allowed_methods());
  }
}

void report_error(request &req, const http::exception &e) {
  if (req.headers_committed()) {
    logger::message(fmt::format("Cannot return http error {} with reason {}, response already started",
                                e.code(), e.what()));
    return;
  }

  const auto req_uuid = respond_error(req, e);
  logger::message(fmt::format("Returning with http error {} ({}) with reason {}, req_uuid {}",
                              e.code(), e.client_code(), e.what(), req_uuid));
}

} // anonymous namespace

void process_request(request &req, const routes &route,
                     user_store::factory &factory,
                     auth_services &services) {

  try {
    const auto start_time = std::chrono::steady_clock::now();

    const auto ip = fcgi_get_env(req, "REMOTE_ADDR", "");

    const char *origin = req.get_param("HTTP_ORIGIN");
    req.set_cors_allowed(origin && services.cors_origins.count(origin) > 0);

    request_cookie_store cookies(req);

    std::unique_ptr<Transaction_Owner_Base> default_transaction;
    std::unique_ptr<user_store> users;
    try {
      default_transaction = factory.get_default_transaction();
      users = factory.make_user_store(*default_transaction);
    } catch (const std::exception &e) {
      // the request still runs. anything needing the store fails on
      // first use, the same way a lost connection would.
      logger::message(fmt::format("Unable to set up the user store: {}", e.what()));
      users = std::make_unique<unavailable_user_store>(e.what());
    }

    RequestContext req_ctx{req, cookies, *users, services};

    // resolution never throws. its outcome is only looked at by the
    // handlers which need an authenticated caller.
    req_ctx.auth = resolve_ctx(cookies, *users, services.signer, req.get_current_time());

    const auto maybe_method = http::parse_method(fcgi_get_env(req, "REQUEST_METHOD"));

    // figure how to handle the request
    auto handler = route(req);

    if (!maybe_method || !handler->allows_method(*maybe_method)) {
      process_not_allowed(req, handler->allowed_methods());
      return;
    }

    // override the default access control allow methods header
    req.set_default_methods(handler->allowed_methods());

    if (*maybe_method == http::method::OPTIONS) {
      process_options_request(req, *handler);
      return;
    }

    const std::string request_name = handler->log_name();
    logger::message(fmt::format("Started request for {} from {}", request_name, ip));

    if (handler->requires_auth())
      require_ctx(req_ctx.auth);

    handler->handle(req_ctx);

    // log the completion time (note: this comes last to avoid
    // logging twice when an error is thrown.)
    const auto end_time = std::chrono::steady_clock::now();
    const auto delta = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
    logger::message(fmt::format("Completed request for {} from {} in {:d} ms",
                                request_name, ip, delta));

  } catch (const http::method_not_allowed &e) {
    process_not_allowed(req, e.allowed_methods);

  } catch (const http::exception &e) {
    // errors here occur before we've started writing the response
    // so we can send something helpful back to the client.
    report_error(req, e);

  } catch (const std::exception &e) {
    report_error(req, http::server_error(e.what()));

    // re-throw the exception for higher-level handling
    throw;
  }
}
