/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <swarm/chunk/single_owner.hpp>

#include <algorithm>

namespace swarm::chunk {
  namespace {
    Address socAddress(BytesIn id, BytesIn owner) {
      Bytes preimage{id.begin(), id.end()};
      preimage.insert(preimage.end(), owner.begin(), owner.end());
      return Address{BytesIn{crypto::sha256(preimage)}};
    }

    Bytes signedData(BytesIn id, BytesIn payload) {
      Bytes data{id.begin(), id.end()};
      auto payload_hash = crypto::sha256(payload);
      data.insert(data.end(), payload_hash.begin(), payload_hash.end());
      return data;
    }
  }  // namespace

  outcome::result<Chunk> makeSingleOwner(
      const SocId &id,
      BytesIn payload,
      const crypto::secp256k1::Secp256k1Signer &owner,
      TagId tag_id) {
    OUTCOME_TRY(signature, owner.sign(signedData(id, payload)));
    Bytes data{id.begin(), id.end()};
    data.insert(data.end(), owner.publicKey().begin(), owner.publicKey().end());
    data.insert(data.end(), signature.begin(), signature.end());
    data.insert(data.end(), payload.begin(), payload.end());
    return Chunk{socAddress(id, owner.publicKey()), std::move(data), tag_id};
  }

  bool isValidSingleOwner(const Chunk &chunk) {
    if (chunk.data.size() < kSocHeaderSize) {
      return false;
    }
    BytesIn data{chunk.data};
    auto id = data.first(kSocIdSize);
    auto owner_bytes = data.subspan(kSocIdSize, kSocOwnerSize);
    auto signature = data.subspan(kSocIdSize + kSocOwnerSize, kSocSignatureSize);
    auto payload = data.subspan(kSocHeaderSize);
    if (socAddress(id, owner_bytes) != chunk.address) {
      return false;
    }
    crypto::secp256k1::PublicKey owner;
    std::ranges::copy(owner_bytes, owner.begin());
    auto valid = crypto::secp256k1::Secp256k1Signer::verify(
        signedData(id, payload), signature, owner);
    return valid.has_value() and valid.value();
  }

}  // namespace swarm::chunk
