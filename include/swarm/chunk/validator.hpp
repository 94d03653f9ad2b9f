/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <swarm/chunk/chunk.hpp>

namespace swarm::chunk {

  /**
   * Validity predicates of the two chunk kinds.
   */
  class Validator {
   public:
    virtual ~Validator() = default;

    /// Address is the content hash of the data.
    virtual bool isContentAddressed(const Chunk &chunk) const = 0;

    /// Address is derived from the owner identity and the data is signed by
    /// the owner.
    virtual bool isSingleOwner(const Chunk &chunk) const = 0;
  };

}  // namespace swarm::chunk
