/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef REQUEST_HELPERS_HPP
#define REQUEST_HELPERS_HPP

#include "authgate/request.hpp"

#include <string>

/**
 * Lookup a string from the request environment. Throws 500 error if the
 * string isn't there and no default value is given.
 */
std::string fcgi_get_env(const request &req,
                         const char *name,
                         const char *default_value = nullptr);

/**
 * get the path from the $REQUEST_URI variable, without query string.
 */
std::string get_request_path(const request &req);

/**
 * true if the request declares a JSON body in $CONTENT_TYPE. parameters
 * such as "; charset=utf-8" are ignored.
 */
bool has_json_content_type(const request &req);

#endif /* REQUEST_HELPERS_HPP */
