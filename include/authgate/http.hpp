/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef HTTP_HPP
#define HTTP_HPP

#include <cstdint>
#include <exception>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

/**
 * Contains the generic HTTP methods and classes involved in the
 * application. FastCGI-specific stuff is elsewhere.
 */
namespace http {

  enum class method : uint8_t {
    GET     = 0b00001,
    POST    = 0b00010,
    PUT     = 0b00100,
    HEAD    = 0b01000,
    OPTIONS = 0b10000
  };

  using headers_t = std::vector<std::pair<std::string, std::string> >;

  std::string format_header(int status, const headers_t &headers);

  /**
   * return a static string description for an HTTP status code.
   */
  const char *status_message(int code);


/**
 * Base class for HTTP protocol related exceptions.
 *
 * Every exception carries two texts: a short, fixed client code which
 * is safe to return in the response body (e.g. "LOGIN_FAIL"), and a
 * message for the server log which may contain internal details and
 * must never reach the client.
 *
 * Not directly constructable - use the derived classes instead.
 */
class exception : public std::exception {
private:
  /// numerical status code, for more information see
  /// http://en.wikipedia.org/wiki/List_of_HTTP_status_codes
  const int code_;

  /// client-safe error classification
  const std::string client_code_;

  /// specific error message, for the log only.
  const std::string message_;

protected:
  exception(int c, std::string client_code, std::string m);

public:
  ~exception() noexcept override = default;

  int code() const;
  const std::string &client_code() const;
  const char* header() const;
  const char* what() const noexcept override;
};

/**
 * An error which has caused the current request to fail which is
 * due to an internal error or code bug. Use only for conditions
 * which are unrecoverable.
 */
class server_error : public exception {
public:
  explicit server_error(const std::string &message);
};

/**
 * The server is temporarily unable to handle the request, e.g. because
 * the password hashing workers are saturated.
 */
class service_unavailable : public exception {
public:
  explicit service_unavailable(const std::string &message);
};

/**
 * The client's request is badly-formed and cannot be serviced. Used
 * mainly for parse errors, or invalid data.
 */
class bad_request : public exception {
public:
  explicit bad_request(const std::string &message);
};

/**
 * Login was refused. The same classification is used for an unknown
 * user, a user without a password and a wrong password.
 */
class login_fail : public exception {
public:
  explicit login_fail(const std::string &message);
};

/**
 * The route requires an authenticated caller and there is none.
 */
class no_auth : public exception {
public:
  explicit no_auth(const std::string &message);
};

/**
 * The client has attempted to use an HTTP method which is not
 * supported on the receiving URI.
 */
class method_not_allowed : public exception {
public:
  explicit method_not_allowed(http::method method);
  http::method allowed_methods;
};

/**
 * The request is larger than the server is willing or able to process.
 */
class payload_too_large : public exception {
public:
  explicit payload_too_large(const std::string &message);
};

/**
 * The request resource could not be found, or is not handled
 * by the server.
 */
class not_found : public exception {
public:
  explicit not_found(const std::string &uri);
};

/**
 * The payload is in a format not supported by this method on the
 * target resource.
 */
class unsupported_media_type : public exception {
public:
  explicit unsupported_media_type(const std::string &message);
};


// allow bitset-like operators on methods
constexpr method operator|(method a, method b) {
  return static_cast<method>(static_cast<std::underlying_type_t<method>>(a) |
                             static_cast<std::underlying_type_t<method>>(b));
}
constexpr method operator&(method a, method b) {
  return static_cast<method>(static_cast<std::underlying_type_t<method>>(a) &
                             static_cast<std::underlying_type_t<method>>(b));
}
constexpr method& operator|=(method& a, method b)
{
  return a= a | b;
}

// return a comma-delimited string describing the methods.
std::string list_methods(method m);

// parse a single method string into a http::method enum, or return none
// if it's not a known value.
std::optional<method> parse_method(const std::string &);

// parse CONTENT_LENGTH HTTP header, rejecting anything above max_size
unsigned long parse_content_length(const std::string &, unsigned long max_size);

std::ostream &operator<<(std::ostream &, method);

} // namespace http

#endif /* HTTP_HPP */
