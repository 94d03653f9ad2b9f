/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <swarm/crypto/sha256.hpp>

#include <openssl/sha.h>

namespace swarm::crypto {
  Hash256 sha256(BytesIn input) {
    Hash256 hash;
    SHA256(input.data(), input.size(), hash.data());
    return hash;
  }
}  // namespace swarm::crypto
