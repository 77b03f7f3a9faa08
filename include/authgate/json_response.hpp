/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef JSON_RESPONSE_HPP
#define JSON_RESPONSE_HPP

#include "authgate/http.hpp"
#include "authgate/json_writer.hpp"
#include "authgate/request.hpp"

#include <functional>
#include <string>

/**
 * writes a 200 response with body {"result":{...}}. fill writes the
 * members of the result object.
 */
void respond_result(request &req, const std::function<void(json_writer &)> &fill);

/**
 * writes the error response for e: {"error":{"message":<client code>,
 * "data":{"req_uuid":<uuid>}}}. the uuid is returned so it can be
 * logged with the internal reason.
 */
std::string respond_error(request &req, const http::exception &e);

#endif /* JSON_RESPONSE_HPP */
