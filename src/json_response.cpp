/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/json_response.hpp"
#include "authgate/output_buffer.hpp"

#include <new>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>


namespace {

// collects the body so Content-Length is known before the headers go out
struct string_buffer : public output_buffer {
  int write(const char *buffer, int len) noexcept override {
    try {
      body.append(buffer, len);
    } catch (const std::bad_alloc &) {
      return -1;
    }
    return len;
  }

  [[nodiscard]] int written() const override { return static_cast<int>(body.size()); }

  int close() noexcept override { return 0; }

  int flush() noexcept override { return 0; }

  std::string body;
};

void send_json(request &req, int status, const std::string &body) {
  req.status(status)
     .add_header("Content-Type", "application/json; charset=utf-8")
     .add_header("Content-Length", std::to_string(body.size()))
     .add_header("Cache-Control", "no-cache")
     .put(body);

  req.finish();
}

} // anonymous namespace

void respond_result(request &req, const std::function<void(json_writer &)> &fill) {
  string_buffer buffer;
  {
    json_writer writer(buffer);
    writer.start_object();
    writer.object_key("result");
    writer.start_object();
    fill(writer);
    writer.end_object();
    writer.end_object();
    writer.flush();
  }

  send_json(req, 200, buffer.body);
}

std::string respond_error(request &req, const http::exception &e) {
  const auto req_uuid = boost::uuids::to_string(boost::uuids::random_generator()());

  string_buffer buffer;
  {
    json_writer writer(buffer);
    writer.start_object();
    writer.object_key("error");
    writer.start_object();
    writer.property("message", e.client_code());
    writer.object_key("data");
    writer.start_object();
    writer.property("req_uuid", req_uuid);
    writer.end_object();
    writer.end_object();
    writer.end_object();
    writer.flush();
  }

  send_json(req, e.code(), buffer.body);
  return req_uuid;
}
