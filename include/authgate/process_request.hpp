/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef PROCESS_REQUEST_HPP
#define PROCESS_REQUEST_HPP

#include "authgate/request.hpp"
#include "authgate/request_context.hpp"
#include "authgate/routes.hpp"
#include "authgate/user_store.hpp"

/**
 * process a single request: resolve the auth context, route, run the
 * handler and turn errors into JSON error responses.
 */
void process_request(request &req, const routes &route,
                     user_store::factory &factory,
                     auth_services &services);

#endif /* PROCESS_REQUEST_HPP */
