/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/handler.hpp"

handler::handler(http::method methods, bool requires_auth)
  : m_allowed_methods(methods | http::method::OPTIONS),
    m_requires_auth(requires_auth) {}
