/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/json_writer.hpp"

#include <stdexcept>


json_writer::json_writer(output_buffer &out)
    : out(out) {

  gen = yajl_gen_alloc(nullptr);

  if (gen == nullptr) {
    throw std::runtime_error("error creating json writer.");
  }

  yajl_gen_config(gen, yajl_gen_beautify, 0);
  // the body may echo user supplied strings
  yajl_gen_config(gen, yajl_gen_validate_utf8, 1);
}

json_writer::~json_writer() {
  yajl_gen_free(gen);
}

void json_writer::start_object() {
  check(yajl_gen_map_open(gen));
}

void json_writer::object_key(std::string_view sv) {
  entry(sv);
}

void json_writer::end_object() {
  check(yajl_gen_map_close(gen));
}

void json_writer::entry(bool b) {
  check(yajl_gen_bool(gen, b ? 1 : 0));
}

void json_writer::flush() {
  const unsigned char *yajl_buf = nullptr;
  size_t yajl_buf_len = 0;

  check(yajl_gen_get_buf(gen, &yajl_buf, &yajl_buf_len));

  if (yajl_buf_len != 0) {
    int wrote_len = out.write(reinterpret_cast<const char *>(yajl_buf), static_cast<int>(yajl_buf_len));

    if (wrote_len != static_cast<int>(yajl_buf_len)) {
      throw output_writer::write_error(
          "Output buffer wrote a different amount than was expected.");
    }
  }

  yajl_gen_clear(gen);
}

void json_writer::check(yajl_gen_status status) {
  switch (status) {
  case yajl_gen_status_ok:
    return;
  case yajl_gen_invalid_string:
    throw output_writer::write_error("invalid UTF-8 in JSON string.");
  case yajl_gen_keys_must_be_strings:
  case yajl_gen_in_error_state:
  case yajl_gen_generation_complete:
    throw output_writer::write_error("JSON document structure error.");
  default:
    throw output_writer::write_error("JSON generator error.");
  }
}
