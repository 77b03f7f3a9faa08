/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef BASE64_HPP
#define BASE64_HPP

#include <stdexcept>
#include <string>
#include <string_view>

/**
 * url-safe base64 without padding, as used for keys, the scheme "01"
 * blob and every part of a token.
 */
namespace b64u {

class decode_error : public std::runtime_error {
public:
  explicit decode_error(const std::string &message);
};

[[nodiscard]] std::string encode(std::string_view bytes);

// strict decoder: rejects padding, characters outside the url-safe
// alphabet and non-canonical trailing bits.
[[nodiscard]] std::string decode(std::string_view text);

// decodes and additionally requires the result to be valid UTF-8.
[[nodiscard]] std::string decode_to_string(std::string_view text);

} // namespace b64u

/**
 * standard alphabet base64 without padding, used in the PHC string
 * format produced by the argon2 scheme.
 */
namespace b64 {

[[nodiscard]] std::string encode_nopad(std::string_view bytes);

[[nodiscard]] std::string decode_nopad(std::string_view text);

} // namespace b64

#endif /* BASE64_HPP */
