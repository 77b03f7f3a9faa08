/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/base64.hpp"
#include "authgate/crypto.hpp"
#include "authgate/options.hpp"

#include <cryptopp/cryptlib.h>

#include <cstring>
#include <iostream>

/**
 * prints a new random secret, base64url encoded, for --pwd-key and
 * --token-key.
 */
int main(int argc, char **argv) {
  if (argc > 1 && (std::strcmp(argv[1], "--help") == 0 || std::strcmp(argv[1], "-h") == 0)) {
    std::cout << "Usage: " << argv[0] << "\n"
              << "Prints a random " << SECRET_KEY_LENGTH
              << " byte key, base64url encoded, for --pwd-key and --token-key." << std::endl;
    return 0;
  }

  try {
    std::cout << b64u::encode(crypto::random_bytes(SECRET_KEY_LENGTH)) << std::endl;
  } catch (const CryptoPP::Exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
