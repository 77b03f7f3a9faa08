/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/http.hpp"

#include <cstdlib>
#include <map>
#include <sstream>

#include <fmt/core.h>

namespace http {

const char *status_message(int code) {

  switch (code) {
  case 200:
    return "OK";
  case 400:
    return "Bad Request";
  case 403:
    return "Forbidden";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 413:
    return "Payload Too Large";
  case 415:
    return "Unsupported Media Type";
  case 503:
    return "Service Unavailable";
  default:
    return "Internal Server Error";
  }
}

std::string format_header(int status, const headers_t &headers) {
  std::string hdr{};
  hdr += fmt::format("Status: {} {}\r\n", status, status_message(status));
  for (const auto& [name, value] : headers) {
    hdr += fmt::format("{}: {}\r\n", name, value);
  }
  hdr += "\r\n";
  return hdr;
}

exception::exception(int c, std::string client_code, std::string m)
    : code_(c), client_code_(std::move(client_code)), message_(std::move(m)) {}

int exception::code() const { return code_; }

const std::string &exception::client_code() const { return client_code_; }

const char *exception::header() const { return status_message(code()); }

const char *exception::what() const noexcept { return message_.c_str(); }

server_error::server_error(const std::string &message)
    : exception(500, "SERVICE_ERROR", message) {}

service_unavailable::service_unavailable(const std::string &message)
    : exception(503, "SERVICE_ERROR", message) {}

bad_request::bad_request(const std::string &message)
    : exception(400, "BAD_REQUEST", message) {}

login_fail::login_fail(const std::string &message)
    : exception(403, "LOGIN_FAIL", message) {}

no_auth::no_auth(const std::string &message)
    : exception(403, "NO_AUTH", message) {}

not_found::not_found(const std::string &uri)
    : exception(404, "NOT_FOUND", uri) {}

payload_too_large::payload_too_large(const std::string &message)
    : exception(413, "PAYLOAD_TOO_LARGE", message) {}

unsupported_media_type::unsupported_media_type(const std::string &message)
    : exception(415, "UNSUPPORTED_MEDIA_TYPE", message) {}

method_not_allowed::method_not_allowed(http::method method)
   :  exception(405, "METHOD_NOT_ALLOWED", http::list_methods(method)),
      allowed_methods(method) {}

namespace {

const std::map<method, std::string> METHODS = {
  {method::GET,     "GET"},
  {method::POST,    "POST"},
  {method::PUT,     "PUT"},
  {method::HEAD,    "HEAD"},
  {method::OPTIONS, "OPTIONS"}
};

} // anonymous namespace

std::string list_methods(method m) {
  std::ostringstream result;

  bool first = true;
  for (auto const &pair : METHODS) {
    if ((m & pair.first) == pair.first) {
      if (first) { first = false; } else { result << ", "; }
      result << pair.second;
    }
  }
  return result.str();
}

std::optional<method> parse_method(const std::string &s) {
  std::optional<method> result;

  for (auto const &pair : METHODS) {
    if (pair.second == s) {
      result = pair.first;
      break;
    }
  }
  return result;
}

std::ostream &operator<<(std::ostream &out, method m) {
  std::string s = list_methods(m);
  out << "methods{" << s << "}";
  return out;
}

unsigned long parse_content_length(const std::string &content_length_str, unsigned long max_size) {

  char *end = nullptr;

  const long length = strtol(content_length_str.c_str(), &end, 10);

  if (end == content_length_str.c_str()) {
    throw http::bad_request("CONTENT_LENGTH not a decimal number");
  } else if ('\0' != *end) {
    throw http::bad_request("CONTENT_LENGTH: extra characters at end of input");
  } else if (length < 0) {
    throw http::bad_request("CONTENT_LENGTH: invalid value");
  } else if (static_cast<unsigned long>(length) > max_size) {
    throw http::payload_too_large(fmt::format("CONTENT_LENGTH exceeds limit of {:d} bytes", max_size));
  }

  return length;
}

} // namespace http
