/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <swarm/common/types.hpp>

namespace swarm::crypto {

  /**
   * Signs with the identity key of the local node.
   */
  class Signer {
   public:
    virtual ~Signer() = default;

    virtual outcome::result<Bytes> sign(BytesIn data) const = 0;
  };

}  // namespace swarm::crypto
