/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstddef>

namespace swarm::protocol::pushsync {
  struct PushSyncConfig {
    // Fixes default field values with boost::di.
    PushSyncConfig() = default;

    /// Peers attempted by one push before giving up.
    size_t max_peers = 5;
    /// Time to handle one inbound delivery, forwarding included.
    std::chrono::milliseconds time_to_live{5000};
    /// Time to write a delivery and read its receipt.
    std::chrono::milliseconds delivery_timeout{1000};
    /// Time to write a delivery to a neighbor.
    std::chrono::milliseconds replication_timeout{3000};
    /// Neighbors a stored chunk is replicated to.
    size_t peers_to_replicate = 3;
    size_t max_message_size = 128 * 1024;
  };
}  // namespace swarm::protocol::pushsync
