/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <swarm/chunk/chunk.hpp>
#include <swarm/common/context.hpp>

namespace swarm::storage {

  enum class ModePut {
    /// Chunk uploaded by the local user.
    UPLOAD,
    /// Chunk received by push or replication.
    SYNC,
    /// Chunk retrieved on request.
    REQUEST,
  };

  class Putter {
   public:
    virtual ~Putter() = default;

    virtual outcome::result<void> put(const Context &ctx,
                                      ModePut mode,
                                      const Chunk &chunk) = 0;
  };

}  // namespace swarm::storage
