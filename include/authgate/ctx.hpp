/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef CTX_HPP
#define CTX_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

class ctx_create_error : public std::runtime_error {
public:
  explicit ctx_create_error(const std::string &message) : std::runtime_error(message) {}
};

/**
 * The identity a request acts as.
 */
class ctx {
public:
  // internal context for maintenance work, not bound to a user.
  static ctx root_ctx();

  // throws ctx_create_error for user id 0, which is reserved for root.
  static ctx create(int64_t user_id);

  int64_t user_id() const { return m_user_id; }

  bool operator==(const ctx &) const = default;

private:
  explicit ctx(int64_t user_id) : m_user_id(user_id) {}

  int64_t m_user_id;
};

#endif /* CTX_HPP */
