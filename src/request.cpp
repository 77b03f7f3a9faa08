/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/request.hpp"
#include "authgate/output_buffer.hpp"

#include <stdexcept>

#include <fmt/core.h>

namespace {
// browsers only send the auth cookie cross-origin when credentials are
// explicitly allowed for that origin, so only listed origins get them.
void set_default_headers(request &req) {
  const char *origin = req.get_param("HTTP_ORIGIN");
  if (origin && req.cors_allowed()) {
    req.add_header("Access-Control-Allow-Credentials", "true")
       .add_header("Access-Control-Allow-Methods", http::list_methods(req.methods()))
       .add_header("Access-Control-Allow-Origin", std::string(origin));
  }
  if (origin)
    req.add_header("Vary", "Origin");
}
} // anonymous namespace


request& request::status(int code) {
  check_workflow(status_HEADERS);
  m_status = code;
  return *this;
}

request& request::add_header(const std::string &key, const std::string &value) {
  check_workflow(status_HEADERS);
  m_headers.emplace_back(key, value);
  return *this;
}

bool request::headers_committed() const {
  return m_workflow_status >= status_BODY;
}

output_buffer& request::get_buffer() {
  check_workflow(status_BODY);
  return get_buffer_internal();
}

int request::put(const char *ptr, int len) {
  return get_buffer().write(ptr, len);
}

int request::put(std::string_view str) {
  return get_buffer().write(str);
}

void request::finish() {
  check_workflow(status_FINISHED);
  finish_internal();
}

void request::check_workflow(workflow_status this_stage) {
  if (m_workflow_status > this_stage) {
    throw std::runtime_error(fmt::format("Can't move backwards in the request workflow from {:d} to {:d}.",
        static_cast<int>(m_workflow_status), static_cast<int>(this_stage)));
  }

  if (m_workflow_status == this_stage)
    return;

  if (m_workflow_status < status_HEADERS && this_stage >= status_HEADERS) {
    m_workflow_status = status_HEADERS;
  }

  // the CORS headers depend on the handler's methods, which are only
  // known once routing is done.
  if (m_workflow_status < status_BODY && this_stage >= status_BODY) {
    set_default_headers(*this);
    m_workflow_status = status_BODY;
    write_header_info(m_status, m_headers);
  }

  m_workflow_status = this_stage;
}

void request::reset() {
  m_workflow_status = status_NONE;
  m_status = 500;
  m_headers.clear();
  m_methods = http::method::GET | http::method::POST | http::method::OPTIONS;
  m_cors_allowed = false;
}

void request::set_default_methods(http::method m) {
  m_methods = m;
}

http::method request::methods() const {
  return m_methods;
}

void request::set_cors_allowed(bool allowed) {
  m_cors_allowed = allowed;
}

bool request::cors_allowed() const {
  return m_cors_allowed;
}
