/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef PWD_SCHEME_HPP
#define PWD_SCHEME_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

#include <boost/uuid/uuid.hpp>

namespace pwd {

/**
 * A clear password together with the salt of its owner. The content
 * must never be logged.
 */
struct content_to_hash {
  std::string content;
  boost::uuids::uuid salt;
};

namespace scheme {

class error : public std::runtime_error {
public:
  explicit error(const std::string &message) : std::runtime_error(message) {}
};

class key_error : public error {
public:
  explicit key_error(const std::string &message) : error(message) {}
};

class salt_error : public error {
public:
  explicit salt_error(const std::string &message) : error(message) {}
};

class hash_error : public error {
public:
  explicit hash_error(const std::string &message) : error(message) {}
};

// the content does not match the blob
class pwd_validate_error : public error {
public:
  pwd_validate_error() : error("password does not match") {}
};

class scheme_not_found : public error {
public:
  explicit scheme_not_found(std::string_view id);
  const std::string &id() const { return m_id; }

private:
  std::string m_id;
};

/**
 * Keyed HMAC-SHA512 over the content and the raw salt bytes. The salt
 * is not part of the blob, so changing a user's salt invalidates every
 * "01" hash stored for that user.
 */
struct scheme_01 {
  static constexpr std::string_view id = "01";

  std::string hash(const content_to_hash &to_hash, std::string_view key) const;
  void validate(const content_to_hash &to_hash, std::string_view blob, std::string_view key) const;
};

/**
 * Argon2id with the key as the argon2 secret. The blob is the
 * self-describing argon2 string, salt included, and validation uses
 * only what is in the blob.
 */
struct scheme_02 {
  static constexpr std::string_view id = "02";

  static constexpr uint32_t M_COST = 19456;
  static constexpr uint32_t T_COST = 2;
  static constexpr uint32_t PARALLELISM = 1;
  static constexpr std::size_t OUTPUT_LEN = 32;

  std::string hash(const content_to_hash &to_hash, std::string_view key) const;
  void validate(const content_to_hash &to_hash, std::string_view blob, std::string_view key) const;
};

using any_scheme = std::variant<scheme_01, scheme_02>;

// scheme used for every new hash
inline constexpr std::string_view DEFAULT_SCHEME = scheme_02::id;

// throws scheme_not_found for an unknown id.
any_scheme get_scheme(std::string_view id);

std::string hash(const any_scheme &s, const content_to_hash &to_hash, std::string_view key);

void validate(const any_scheme &s, const content_to_hash &to_hash,
              std::string_view blob, std::string_view key);

} // namespace scheme
} // namespace pwd

#endif /* PWD_SCHEME_HPP */
