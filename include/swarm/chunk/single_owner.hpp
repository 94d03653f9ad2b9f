/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <swarm/chunk/chunk.hpp>
#include <swarm/crypto/secp256k1/secp256k1_signer.hpp>

namespace swarm::chunk {

  /**
   * Single-owner chunk layout:
   * `id (32) | owner public key (33) | signature (64) | payload`.
   * Address is `sha256(id | owner)`, the owner signs
   * `id | sha256(payload)`.
   */
  constexpr size_t kSocIdSize = 32;
  constexpr size_t kSocOwnerSize = crypto::secp256k1::PublicKey{}.size();
  constexpr size_t kSocSignatureSize =
      crypto::secp256k1::SignatureCompact{}.size();
  constexpr size_t kSocHeaderSize =
      kSocIdSize + kSocOwnerSize + kSocSignatureSize;

  using SocId = std::array<uint8_t, kSocIdSize>;

  outcome::result<Chunk> makeSingleOwner(
      const SocId &id,
      BytesIn payload,
      const crypto::secp256k1::Secp256k1Signer &owner,
      TagId tag_id = 0);

  bool isValidSingleOwner(const Chunk &chunk);

}  // namespace swarm::chunk
