/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstring>

#include <swarm/common/address.hpp>
#include <swarm/crypto/secp256k1/secp256k1_signer.hpp>

namespace swarm {
  /**
   * Deterministic identity of node `index`, for examples and tests.
   * Overlay address is SHA-256 of the public key.
   */
  struct SampleNode {
    static crypto::secp256k1::PrivateKey samplePrivateKey(size_t index) {
      crypto::secp256k1::PrivateKey private_key;
      std::array<uint64_t, sizeof(private_key) / sizeof(uint64_t)> seed64;
      static_assert(sizeof(seed64) >= sizeof(private_key));
      for (size_t i = 0; i < seed64.size(); ++i) {
        seed64.at(i) = i + index + 1;
      }
      memcpy(private_key.data(), seed64.data(), private_key.size());
      return private_key;
    }

    explicit SampleNode(size_t index)
        : index{index},
          signer{crypto::secp256k1::Secp256k1Signer::create(
                     samplePrivateKey(index))
                     .value()},
          address{BytesIn{crypto::sha256(signer->publicKey())}} {}

    size_t index;
    std::shared_ptr<crypto::secp256k1::Secp256k1Signer> signer;
    Address address;
  };
}  // namespace swarm
