/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/ctx.hpp"

#include <fmt/core.h>

ctx ctx::root_ctx() {
  return ctx(0);
}

ctx ctx::create(int64_t user_id) {
  if (user_id == 0)
    throw ctx_create_error(fmt::format("cannot create a context for user id {}", user_id));
  return ctx(user_id);
}
