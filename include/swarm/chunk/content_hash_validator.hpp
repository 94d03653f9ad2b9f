/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <swarm/chunk/validator.hpp>

namespace swarm::chunk {

  /**
   * Content address is SHA-256 of the data.
   * Single-owner chunks as laid out in `single_owner.hpp`.
   */
  class ContentHashValidator : public Validator {
   public:
    bool isContentAddressed(const Chunk &chunk) const override;

    bool isSingleOwner(const Chunk &chunk) const override;
  };

  /// Content-addressed chunk of `data`.
  Chunk makeContentAddressed(Bytes data, TagId tag_id = 0);

}  // namespace swarm::chunk
