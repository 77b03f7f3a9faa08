/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "test_request.hpp"

#include <cstring>
#include <stdexcept>

#include <fmt/core.h>

test_output_buffer::test_output_buffer(std::ostream &out, std::ostream &body)
  : m_out(out), m_body(body) {
}

int test_output_buffer::write(const char *buffer, int len) noexcept {
  m_body.write(buffer, len);
  m_out.write(buffer, len);
  m_written += len;
  return len;
}

int test_output_buffer::written() const {
  return m_written;
}

int test_output_buffer::close() noexcept {
  return 0;
}

int test_output_buffer::flush() noexcept {
  return 0;
}

test_request::test_request(unsigned long payload_max_size)
  : m_payload_max_size(payload_max_size) {
}

const char *test_request::get_param(const char *key) const {
  std::string key_str(key);
  auto itr = m_params.find(key_str);
  if (itr != m_params.end()) {
    return itr->second.c_str();
  } else {
    return nullptr;
  }
}

std::string test_request::get_payload() {

  const char *content_length_str = get_param("CONTENT_LENGTH");
  const char *content_encoding = get_param("HTTP_CONTENT_ENCODING");

  if (content_encoding != nullptr && std::strcmp(content_encoding, "identity") != 0)
    throw http::unsupported_media_type("Only the 'identity' Content-Encoding is supported");

  unsigned long content_length = 0;

  if (content_length_str)
    content_length = http::parse_content_length(content_length_str, m_payload_max_size);

  if (m_payload.length() > m_payload_max_size)
    throw http::payload_too_large(fmt::format("Payload exceeds limit of {:d} bytes", m_payload_max_size));

  if (content_length > 0 && m_payload.length() != content_length)
    throw http::bad_request("HTTP Header field 'Content-Length' differs from actual payload length");

  return m_payload;
}

void test_request::set_payload(const std::string& payload) {
  m_payload = payload;
}

void test_request::dispose() {}

void test_request::set_header(const std::string &k, const std::string &v) {
  m_params[k] = v;
}

std::stringstream &test_request::buffer() {
  return m_output;
}

std::stringstream &test_request::body() {
  return m_body;
}

std::stringstream &test_request::header() {
  return m_header;
}

std::chrono::system_clock::time_point test_request::get_current_time() const {
  return m_now;
}

void test_request::set_current_time(const std::chrono::system_clock::time_point &now) {
  m_now = now;
}

void test_request::write_header_info(int status, const http::headers_t &headers) {
  if (m_output.tellp() != 0)
    throw std::runtime_error("headers written twice");
  m_status = status;
  m_response_headers = headers;

  auto hdr = http::format_header(status, headers);
  m_output << hdr;
  m_header << hdr;
}

int test_request::response_status() const {
  return m_status;
}

std::vector<std::string> test_request::response_headers(const std::string &name) const {
  std::vector<std::string> values;
  for (const auto &[k, v] : m_response_headers) {
    if (k == name)
      values.push_back(v);
  }
  return values;
}

output_buffer& test_request::get_buffer_internal() {
  if (!test_ob_buffer)
    test_ob_buffer = std::make_unique<test_output_buffer>(m_output, m_body);
  return *test_ob_buffer;
}

void test_request::finish_internal() {}
