/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef REQUEST_CONTEXT_HPP
#define REQUEST_CONTEXT_HPP

#include "authgate/auth_context.hpp"
#include "authgate/cookies.hpp"
#include "authgate/pwd/password_hasher.hpp"
#include "authgate/request.hpp"
#include "authgate/token.hpp"
#include "authgate/user_store.hpp"

#include <optional>
#include <set>
#include <string>

// process wide services, created once at startup.
struct auth_services
{
    pwd::password_hasher& hasher;
    const token::token_signer& signer;
    // origins granted credentialed CORS access
    const std::set<std::string>& cors_origins;
};

struct RequestContext
{
    request& req;
    cookie_store& cookies;
    user_store& users;
    auth_services& services;

    // outcome of the auth context resolution, empty if it didn't run
    std::optional<ctx_ext_result> auth = {};
};

#endif /* REQUEST_CONTEXT_HPP */
