/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/fcgi_request.hpp"
#include "authgate/http.hpp"
#include "authgate/output_buffer.hpp"

#include <fmt/core.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <fcgiapp.h>


namespace {
struct fcgi_buffer : public output_buffer {

  fcgi_buffer() = delete;
  fcgi_buffer(const fcgi_buffer&) = delete;
  fcgi_buffer& operator=(const fcgi_buffer&) = delete;
  fcgi_buffer(fcgi_buffer&&) = delete;
  fcgi_buffer& operator=(fcgi_buffer&&) = delete;

  explicit fcgi_buffer(FCGX_Request req) : m_req(req) {}

  ~fcgi_buffer() override = default;

  int write(const char *buffer, int len) noexcept override {
    int bytes = FCGX_PutStr(buffer, len, m_req.out);
    if (bytes >= 0) {
      m_written += bytes;
    }
    return bytes;
  }

  [[nodiscard]] int written() const override { return m_written; }

  int close() noexcept override { return FCGX_FClose(m_req.out); }

  int flush() noexcept override { return FCGX_FFlush(m_req.out); }

private:
  FCGX_Request m_req;
  int m_written{0};
};
}

struct fcgi_request::pimpl {
  FCGX_Request req;
  std::chrono::system_clock::time_point now;
};

fcgi_request::fcgi_request(int socket, const std::chrono::system_clock::time_point &now,
                           unsigned long payload_max_size)
  : m_impl(std::make_unique<pimpl>()),
    m_payload_max_size(payload_max_size) {

  if (FCGX_Init() != 0) {
    throw std::runtime_error("Couldn't initialise FCGX library.");
  }
  if (FCGX_InitRequest(&m_impl->req, socket, FCGI_FAIL_ACCEPT_ON_INTR) != 0) {
    throw std::runtime_error("Couldn't initialise FCGX request structure.");
  }
  m_impl->now = now;
  m_buffer = std::make_unique<fcgi_buffer>(m_impl->req);
}

fcgi_request::~fcgi_request() { FCGX_Free(&m_impl->req, true); }

const char *fcgi_request::get_param(const char *key) const {
  return FCGX_GetParam(key, m_impl->req.envp);
}

std::string fcgi_request::get_payload() {

  const char *content_length_str = FCGX_GetParam("CONTENT_LENGTH", m_impl->req.envp);
  const char *content_encoding = FCGX_GetParam("HTTP_CONTENT_ENCODING", m_impl->req.envp);

  if (content_encoding != nullptr && std::strcmp(content_encoding, "identity") != 0)
    throw http::unsupported_media_type("Only the 'identity' Content-Encoding is supported");

  unsigned long content_length = 0;

  if (content_length_str)
    content_length = http::parse_content_length(content_length_str, m_payload_max_size);

  std::string result{};
  int curr_content_length = 0;

  while ((curr_content_length = FCGX_GetStr(content_buffer.data(), BUFFER_LEN, m_impl->req.in)) > 0)
  {
    result.append(content_buffer.data(), curr_content_length);

    if (result.length() > m_payload_max_size)
      throw http::payload_too_large(fmt::format("Payload exceeds limit of {:d} bytes", m_payload_max_size));
  }

  if (content_length > 0 && result.length() != content_length)
    throw http::bad_request("HTTP Header field 'Content-Length' differs from actual payload length");

  return result;
}

std::chrono::system_clock::time_point fcgi_request::get_current_time() const {
  return m_impl->now;
}

void fcgi_request::set_current_time(const std::chrono::system_clock::time_point &now) {
  m_impl->now = now;
}

void fcgi_request::write_header_info(int status, const http::headers_t &headers) {
  const auto hdr = http::format_header(status, headers);
  if (m_buffer->write(hdr) < 0)
    throw std::runtime_error("Failed to write response header.");
}

output_buffer& fcgi_request::get_buffer_internal() {
  return *m_buffer;
}

void fcgi_request::finish_internal() {}

void fcgi_request::dispose() { FCGX_Finish_r(&m_impl->req); }

int fcgi_request::accept_r() {
  int status = FCGX_Accept_r(&m_impl->req);
  if (status < 0) {
    if (errno != EINTR) {
      if (errno == ENOTSOCK) {
        throw std::runtime_error("FCGI port or UNIX socket not set properly, please use the "
                                 "--socket option (caused by ENOTSOCK).");
      }

      throw std::runtime_error(fmt::format("error accepting request: {}",
                                           std::generic_category().message(errno)));
    }
  }

  // reset status, as we re-use requests.
  reset();

  // swap out the output buffer for a new one referencing the new
  // request.
  m_buffer = std::make_unique<fcgi_buffer>(m_impl->req);

  return status;
}

int fcgi_request::open_socket(const std::string &path, int backlog) {
  return FCGX_OpenSocket(path.c_str(), backlog);
}
