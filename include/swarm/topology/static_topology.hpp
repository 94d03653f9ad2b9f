/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <vector>

#include <swarm/topology/driver.hpp>

namespace swarm::topology {

  /**
   * Driver over an explicitly managed set of connected peers.
   * Neighbors are peers whose proximity order to the local node is at least
   * `depth`.
   */
  class StaticTopology : public Driver {
   public:
    StaticTopology(Address self, uint8_t depth);

    void addPeer(const Address &peer);

    void removePeer(const Address &peer);

    void setDepth(uint8_t depth);

    outcome::result<ClosestPeer> closestPeer(
        const Address &address, std::span<const Address> skip) const override;

    bool isWithinDepth(const Address &address) const override;

    outcome::result<void> eachNeighbor(
        const NeighborVisitor &visit) const override;

   private:
    Address self_;
    mutable std::mutex mutex_;
    uint8_t depth_;
    std::vector<Address> peers_;
  };

}  // namespace swarm::topology
