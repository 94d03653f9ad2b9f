/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <swarm/common/address.hpp>

namespace swarm {

  /// Upload progress tag id, zero if the chunk is not tracked.
  using TagId = uint32_t;

  /**
   * Addressed unit of stored data.
   */
  struct Chunk {
    Address address;
    Bytes data;
    TagId tag_id = 0;
  };

}  // namespace swarm
