/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <swarm/chunk/content_hash_validator.hpp>

#include <algorithm>

#include <swarm/chunk/single_owner.hpp>
#include <swarm/crypto/sha256.hpp>

namespace swarm::chunk {

  bool ContentHashValidator::isContentAddressed(const Chunk &chunk) const {
    auto hash = crypto::sha256(chunk.data);
    return std::ranges::equal(hash, chunk.address.bytes());
  }

  bool ContentHashValidator::isSingleOwner(const Chunk &chunk) const {
    return isValidSingleOwner(chunk);
  }

  Chunk makeContentAddressed(Bytes data, TagId tag_id) {
    auto hash = crypto::sha256(data);
    return Chunk{Address{BytesIn{hash}}, std::move(data), tag_id};
  }

}  // namespace swarm::chunk
