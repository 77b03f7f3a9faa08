/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef OUTPUT_WRITER_HPP
#define OUTPUT_WRITER_HPP

#include <stdexcept>
#include <string>

/**
 * Base type for the writers which produce response bodies.
 */
class output_writer {
public:
  output_writer() = default;
  virtual ~output_writer() = default;

  output_writer(const output_writer &) = delete;
  output_writer& operator=(const output_writer &) = delete;

  // write any buffered output through to the request.
  virtual void flush() = 0;

  // thrown when the underlying output buffer refuses data.
  class write_error : public std::runtime_error {
  public:
    explicit write_error(const char *message) : std::runtime_error(message) {}
  };
};

#endif /* OUTPUT_WRITER_HPP */
