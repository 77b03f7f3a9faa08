/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/base64.hpp"
#include "authgate/util.hpp"

#include <cryptopp/base64.h>
#include <cryptopp/filters.h>

#include <fmt/core.h>

using namespace CryptoPP;

namespace {

enum class alphabet { standard, url };

int sextet(char c, alphabet a) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;

  if (a == alphabet::url) {
    if (c == '-') return 62;
    if (c == '_') return 63;
  } else {
    if (c == '+') return 62;
    if (c == '/') return 63;
  }
  return -1;
}

// Crypto++ decoders silently skip characters they don't know, so the
// input has to be checked before it is handed over.
void check_canonical(std::string_view text, alphabet a) {

  for (char c : text) {
    if (sextet(c, a) < 0)
      throw b64u::decode_error(fmt::format("Invalid character 0x{:02x} in base64 input",
                                           static_cast<unsigned char>(c)));
  }

  const auto rest = text.size() % 4;

  if (rest == 1)
    throw b64u::decode_error("Truncated base64 input");

  if (rest == 2 && (sextet(text.back(), a) & 0x0f) != 0)
    throw b64u::decode_error("Non-canonical trailing bits in base64 input");

  if (rest == 3 && (sextet(text.back(), a) & 0x03) != 0)
    throw b64u::decode_error("Non-canonical trailing bits in base64 input");
}

const byte *as_bytes(std::string_view sv) {
  return reinterpret_cast<const byte *>(sv.data());
}

} // anonymous namespace

namespace b64u {

decode_error::decode_error(const std::string &message)
    : std::runtime_error(message) {}

std::string encode(std::string_view bytes) {
  std::string encoded;
  StringSource ss(as_bytes(bytes), bytes.size(), true,
                  new Base64URLEncoder(new StringSink(encoded), false));
  return encoded;
}

std::string decode(std::string_view text) {
  check_canonical(text, alphabet::url);

  std::string decoded;
  StringSource ss(as_bytes(text), text.size(), true,
                  new Base64URLDecoder(new StringSink(decoded)));
  return decoded;
}

std::string decode_to_string(std::string_view text) {
  auto decoded = decode(text);

  if (!is_valid_utf8(decoded))
    throw decode_error("Decoded base64 content is not valid UTF-8");

  return decoded;
}

} // namespace b64u

namespace b64 {

std::string encode_nopad(std::string_view bytes) {
  std::string encoded;
  StringSource ss(as_bytes(bytes), bytes.size(), true,
                  new Base64Encoder(new StringSink(encoded), false));

  while (!encoded.empty() && encoded.back() == '=')
    encoded.pop_back();

  return encoded;
}

std::string decode_nopad(std::string_view text) {
  check_canonical(text, alphabet::standard);

  std::string decoded;
  StringSource ss(as_bytes(text), text.size(), true,
                  new Base64Decoder(new StringSink(decoded)));
  return decoded;
}

} // namespace b64
