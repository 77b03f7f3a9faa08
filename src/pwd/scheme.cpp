/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/pwd/scheme.hpp"
#include "authgate/base64.hpp"
#include "authgate/crypto.hpp"
#include "authgate/util.hpp"

#include <argon2.h>

#include <charconv>
#include <optional>
#include <vector>

#include <fmt/core.h>


namespace pwd::scheme {

namespace {

std::string_view salt_bytes(const boost::uuids::uuid &salt) {
  if (salt.is_nil())
    throw salt_error("salt must not be the nil uuid");
  return { reinterpret_cast<const char *>(salt.data), salt.size() };
}

void check_key(std::string_view key) {
  if (key.empty())
    throw key_error("password key is not set");
}

// upper bounds for parameters read back from a stored blob, so a
// tampered row can't make validation allocate without limit.
constexpr uint32_t MAX_M_COST = 1u << 21;
constexpr uint32_t MAX_T_COST = 16;
constexpr uint32_t MAX_PARALLELISM = 16;

struct argon2_params {
  uint32_t m_cost;
  uint32_t t_cost;
  uint32_t parallelism;
  std::string salt;
  std::string hash;
};

std::optional<uint32_t> parse_u32(std::string_view text, std::string_view prefix) {
  if (text.substr(0, prefix.size()) != prefix)
    return std::nullopt;
  text.remove_prefix(prefix.size());

  uint32_t value = 0;
  const auto *end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc() || ptr != end || text.empty())
    return std::nullopt;
  return value;
}

argon2_params parse_argon2_string(std::string_view blob) {
  // $argon2id$v=19$m=19456,t=2,p=1$<salt>$<hash>
  const auto parts = split(blob, '$');
  if (parts.size() != 6 || !parts[0].empty() || parts[1] != "argon2id")
    throw hash_error("not an argon2id string");

  const auto version = parse_u32(parts[2], "v=");
  if (!version || *version != ARGON2_VERSION_13)
    throw hash_error("unsupported argon2 version");

  const auto params = split(parts[3], ',');
  if (params.size() != 3)
    throw hash_error("malformed argon2 parameters");

  const auto m = parse_u32(params[0], "m=");
  const auto t = parse_u32(params[1], "t=");
  const auto p = parse_u32(params[2], "p=");
  if (!m || !t || !p)
    throw hash_error("malformed argon2 parameters");

  if (*m > MAX_M_COST || *t > MAX_T_COST || *p == 0 || *p > MAX_PARALLELISM)
    throw hash_error("argon2 parameters out of range");

  argon2_params result{ *m, *t, *p, {}, {} };
  try {
    result.salt = b64::decode_nopad(parts[4]);
    result.hash = b64::decode_nopad(parts[5]);
  } catch (const b64u::decode_error &e) {
    throw hash_error(fmt::format("malformed argon2 string: {}", e.what()));
  }

  if (result.salt.size() < ARGON2_MIN_SALT_LENGTH || result.hash.size() < ARGON2_MIN_OUTLEN)
    throw hash_error("argon2 salt or hash too short");

  return result;
}

argon2_context make_context(const content_to_hash &to_hash, std::string_view key,
                            std::string_view salt, uint8_t *out, std::size_t outlen,
                            uint32_t m_cost, uint32_t t_cost, uint32_t parallelism) {
  argon2_context ctx{};
  ctx.out = out;
  ctx.outlen = static_cast<uint32_t>(outlen);
  // argon2 does not modify the password, salt or secret unless asked
  // to clear them through the flags.
  ctx.pwd = reinterpret_cast<uint8_t *>(const_cast<char *>(to_hash.content.data()));
  ctx.pwdlen = static_cast<uint32_t>(to_hash.content.size());
  ctx.salt = reinterpret_cast<uint8_t *>(const_cast<char *>(salt.data()));
  ctx.saltlen = static_cast<uint32_t>(salt.size());
  ctx.secret = reinterpret_cast<uint8_t *>(const_cast<char *>(key.data()));
  ctx.secretlen = static_cast<uint32_t>(key.size());
  ctx.ad = nullptr;
  ctx.adlen = 0;
  ctx.t_cost = t_cost;
  ctx.m_cost = m_cost;
  ctx.lanes = parallelism;
  ctx.threads = parallelism;
  ctx.version = ARGON2_VERSION_13;
  ctx.allocate_cbk = nullptr;
  ctx.free_cbk = nullptr;
  ctx.flags = ARGON2_DEFAULT_FLAGS;
  return ctx;
}

} // anonymous namespace

scheme_not_found::scheme_not_found(std::string_view id)
    : error(fmt::format("scheme '{}' not found", id)), m_id(id) {}


std::string scheme_01::hash(const content_to_hash &to_hash, std::string_view key) const {
  check_key(key);
  try {
    return crypto::hmac_sha512_b64u(key, to_hash.content, salt_bytes(to_hash.salt));
  } catch (const crypto::error &e) {
    throw hash_error(e.what());
  }
}

void scheme_01::validate(const content_to_hash &to_hash, std::string_view blob,
                         std::string_view key) const {
  const auto computed = hash(to_hash, key);
  if (!crypto::constant_time_equals(computed, blob))
    throw pwd_validate_error();
}


std::string scheme_02::hash(const content_to_hash &to_hash, std::string_view key) const {
  check_key(key);
  const auto salt = salt_bytes(to_hash.salt);

  std::vector<uint8_t> out(OUTPUT_LEN);
  auto ctx = make_context(to_hash, key, salt, out.data(), out.size(),
                          M_COST, T_COST, PARALLELISM);

  const int rc = argon2_ctx(&ctx, Argon2_id);
  if (rc != ARGON2_OK)
    throw hash_error(fmt::format("argon2 hashing failed: {}", argon2_error_message(rc)));

  return fmt::format("$argon2id$v={}$m={},t={},p={}${}${}",
                     static_cast<unsigned>(ARGON2_VERSION_13), M_COST, T_COST, PARALLELISM,
                     b64::encode_nopad(salt),
                     b64::encode_nopad(std::string_view(reinterpret_cast<const char *>(out.data()), out.size())));
}

void scheme_02::validate(const content_to_hash &to_hash, std::string_view blob,
                         std::string_view key) const {
  check_key(key);
  const auto params = parse_argon2_string(blob);

  // the salt stored with the user is not used here, the blob carries
  // its own.
  std::vector<uint8_t> out(params.hash.size());
  auto ctx = make_context(to_hash, key, params.salt, out.data(), out.size(),
                          params.m_cost, params.t_cost, params.parallelism);

  const int rc = argon2_verify_ctx(&ctx, params.hash.data(), Argon2_id);
  if (rc == ARGON2_VERIFY_MISMATCH)
    throw pwd_validate_error();
  if (rc != ARGON2_OK)
    throw hash_error(fmt::format("argon2 verification failed: {}", argon2_error_message(rc)));
}


any_scheme get_scheme(std::string_view id) {
  if (id == scheme_01::id)
    return scheme_01{};
  if (id == scheme_02::id)
    return scheme_02{};
  throw scheme_not_found(id);
}

std::string hash(const any_scheme &s, const content_to_hash &to_hash, std::string_view key) {
  return std::visit([&](const auto &impl) { return impl.hash(to_hash, key); }, s);
}

void validate(const any_scheme &s, const content_to_hash &to_hash,
              std::string_view blob, std::string_view key) {
  std::visit([&](const auto &impl) { impl.validate(to_hash, blob, key); }, s);
}

} // namespace pwd::scheme
