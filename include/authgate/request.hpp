/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef REQUEST_HPP
#define REQUEST_HPP

#include "authgate/http.hpp"

#include <chrono>
#include <string>
#include <string_view>


// forward declaration of output_buffer, which is only needed here by
// reference.
struct output_buffer;

/**
 * One inbound HTTP request and its response. The response has to be
 * produced in order: status and headers first, then the body, then
 * finish(). Going back to an earlier stage throws std::runtime_error.
 */
struct request {
  request() = default;
  virtual ~request() = default;

  request(const request &) = delete;
  request& operator=(const request &) = delete;

  // get the value associated with a key in the request environment, e.g.
  // "HTTP_COOKIE" or "REQUEST_METHOD". returns NULL if the key could not
  // be found. this function can be called at any time.
  virtual const char *get_param(const char *key) const = 0;

  // get the time at which the request was accepted.
  virtual std::chrono::system_clock::time_point get_current_time() const = 0;

  // get the body of the request, for POST and PUT.
  virtual std::string get_payload() = 0;

  /********************** RESPONSE HEADER FUNCTIONS **************************/

  // set the status for the response. by default, the status is 500. it is
  // an error to call this after the first call to any output function.
  request& status(int code);

  // add a key-value header to the response. headers may repeat, which
  // is needed for Set-Cookie. it is an error to call this function after
  // a call to any of the output functions.
  request& add_header(const std::string &key, const std::string &value);

  // true once the status and headers have been written out, after which
  // no header can be added any more.
  [[nodiscard]] bool headers_committed() const;

  /********************** RESPONSE OUTPUT FUNCTIONS **************************/

  // return a handle to the output buffer to write body output. this function
  // should only be called after setting the status and any custom response
  // headers.
  output_buffer& get_buffer();

  // convenience functions to write body data.
  int put(const char *, int);
  int put(std::string_view str);

  /******************** RESPONSE FINISHING FUNCTIONS ************************/

  // call this when the entire response - including any body - has been
  // written. it is an error to call any output function after calling this.
  void finish();

  // dispose of any resources allocated to the request.
  virtual void dispose() = 0;

  /******************** CORS ***********************************************/

  void set_default_methods(http::method);
  http::method methods() const;

  // whether the Origin of this request gets the CORS headers
  void set_cors_allowed(bool);
  bool cors_allowed() const;

protected:

  // called once, the first time an output function is called, with the
  // complete set of status & header information.
  virtual void write_header_info(int status, const http::headers_t &headers) = 0;

  virtual output_buffer& get_buffer_internal() = 0;
  virtual void finish_internal() = 0;

  // reset the state of the request back to blank for re-use.
  void reset();

private:
  enum workflow_status {
    status_NONE = 0,
    status_HEADERS = 1,
    status_BODY = 2,
    status_FINISHED = 3
  };
  workflow_status m_workflow_status{status_NONE};

  void check_workflow(workflow_status this_stage);

  int m_status{500};

  http::headers_t m_headers;

  // allowed methods, to be returned to the client in the CORS headers.
  http::method m_methods{http::method::GET | http::method::POST | http::method::OPTIONS};

  bool m_cors_allowed{false};
};

#endif /* REQUEST_HPP */
