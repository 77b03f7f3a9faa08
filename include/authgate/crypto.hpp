/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef CRYPTO_HPP
#define CRYPTO_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace crypto {

class error : public std::runtime_error {
public:
  explicit error(const std::string &message) : std::runtime_error(message) {}
};

class key_error : public error {
public:
  explicit key_error(const std::string &message) : error(message) {}
};

/**
 * HMAC-SHA512 keyed by key over content followed by salt, returned as
 * base64url without padding (86 characters).
 */
[[nodiscard]] std::string hmac_sha512_b64u(std::string_view key,
                                           std::string_view content,
                                           std::string_view salt);

// comparison whose running time does not depend on where the inputs
// differ. inputs of different length compare unequal immediately.
[[nodiscard]] bool constant_time_equals(std::string_view a, std::string_view b);

[[nodiscard]] std::string random_bytes(std::size_t length);

} // namespace crypto

#endif /* CRYPTO_HPP */
