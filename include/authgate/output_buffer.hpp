/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef OUTPUT_BUFFER_HPP
#define OUTPUT_BUFFER_HPP

#include <string_view>

/**
 * Implement this interface to provide custom output.
 */
struct output_buffer {
  // the FastCGI implementation wraps C calls which report errors by
  // return code, so -1 is used to signal errors instead of exceptions.
  virtual int write(const char *buffer, int len) noexcept = 0;
  virtual int write(std::string_view str) noexcept { return write(str.data(), static_cast<int>(str.size())); }
  virtual int written() const = 0;
  virtual int close() noexcept = 0;
  virtual int flush() noexcept = 0;
  virtual ~output_buffer() = default;

  output_buffer() = default;

  output_buffer(const output_buffer&) = delete;
  output_buffer& operator=(const output_buffer&) = delete;

  output_buffer(output_buffer&&) = delete;
  output_buffer& operator=(output_buffer&&) = delete;
};

#endif /* OUTPUT_BUFFER_HPP */
