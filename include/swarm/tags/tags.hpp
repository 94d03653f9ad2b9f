/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <swarm/chunk/chunk.hpp>

namespace swarm::tags {

  /// Upload progress counters.
  enum class State {
    SPLIT,
    STORED,
    SEEN,
    SENT,
    SYNCED,
  };

  /**
   * Progress of one upload.
   */
  class Tag {
   public:
    virtual ~Tag() = default;

    virtual outcome::result<void> inc(State state) = 0;
  };

  class Tags {
   public:
    virtual ~Tags() = default;

    /// Tag with `id`, nullptr if there is none.
    virtual std::shared_ptr<Tag> get(TagId id) const = 0;
  };

}  // namespace swarm::tags
