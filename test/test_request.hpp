/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef TEST_TEST_REQUEST_HPP
#define TEST_TEST_REQUEST_HPP

#include <chrono>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "authgate/request.hpp"
#include "authgate/output_buffer.hpp"

/**
 * Mock output buffer so that we can get back an in-memory result as a string
 * backed buffer.
 */
struct test_output_buffer : public output_buffer {
  explicit test_output_buffer(std::ostream &out, std::ostream &body);
  ~test_output_buffer() override = default;

  int write(const char *buffer, int len) noexcept override;
  [[nodiscard]] int written() const override;
  int close() noexcept override;
  int flush() noexcept override;

private:
  std::ostream &m_out;
  std::ostream &m_body;
  int m_written{0};
};

/**
 * Mock request so that we can control the headers and get back the response
 * body for comparison to what we expect.
 */
struct test_request : public request {
  explicit test_request(unsigned long payload_max_size = 50000);

  /// implementation of request interface
  ~test_request() override = default;
  const char *get_param(const char *key) const override;
  std::string get_payload() override;
  void set_payload(const std::string&);

  void dispose() override;

  /// getters and setters for the input headers and output response
  void set_header(const std::string &k, const std::string &v);
  std::stringstream &buffer();
  std::stringstream &body();
  std::stringstream &header();

  std::chrono::system_clock::time_point get_current_time() const override;
  void set_current_time(const std::chrono::system_clock::time_point &now);

  int response_status() const;

  // values of every response header with this name, in order
  std::vector<std::string> response_headers(const std::string &name) const;

protected:
  void write_header_info(int status, const http::headers_t &headers) override;
  output_buffer& get_buffer_internal() override;
  void finish_internal() override;

private:
  int m_status{-1};
  std::stringstream m_output;
  std::stringstream m_header;
  std::stringstream m_body;
  http::headers_t m_response_headers;
  std::map<std::string, std::string> m_params;
  std::chrono::system_clock::time_point m_now;
  std::string m_payload;
  unsigned long m_payload_max_size;
  std::unique_ptr<test_output_buffer> test_ob_buffer;
};

#endif /* TEST_TEST_REQUEST_HPP */
