/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/crypto.hpp"
#include "authgate/base64.hpp"

#include <cryptopp/hmac.h>
#include <cryptopp/misc.h>
#include <cryptopp/osrng.h>
#include <cryptopp/secblock.h>
#include <cryptopp/sha.h>

#include <fmt/core.h>

using namespace CryptoPP;

namespace {

const byte *as_bytes(std::string_view sv) {
  return reinterpret_cast<const byte *>(sv.data());
}

}

namespace crypto {

std::string hmac_sha512_b64u(std::string_view key,
                             std::string_view content,
                             std::string_view salt) {
  if (key.empty())
    throw key_error("HMAC key must not be empty");

  try {
    HMAC<SHA512> hmac(as_bytes(key), key.size());
    hmac.Update(as_bytes(content), content.size());
    hmac.Update(as_bytes(salt), salt.size());

    SecByteBlock digest(hmac.DigestSize());
    hmac.Final(digest);

    return b64u::encode(std::string_view(reinterpret_cast<const char *>(digest.data()), digest.size()));
  } catch (const CryptoPP::Exception &e) {
    throw error(fmt::format("HMAC-SHA512 failed: {}", e.what()));
  }
}

bool constant_time_equals(std::string_view a, std::string_view b) {
  if (a.size() != b.size())
    return false;
  if (a.empty())
    return true;
  return VerifyBufsEqual(as_bytes(a), as_bytes(b), a.size());
}

std::string random_bytes(std::size_t length) {
  AutoSeededRandomPool rng;
  std::string result(length, '\0');
  rng.GenerateBlock(reinterpret_cast<byte *>(result.data()), result.size());
  return result;
}

} // namespace crypto
