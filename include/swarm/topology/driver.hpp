/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <span>
#include <variant>

#include <swarm/common/address.hpp>

namespace swarm::topology {

  /// Local node is the closest known node to the address.
  struct WantSelf {
    bool operator==(const WantSelf &) const = default;
  };

  /// No eligible peer left.
  struct NotFound {
    bool operator==(const NotFound &) const = default;
  };

  using ClosestPeer = std::variant<Address, WantSelf, NotFound>;

  /**
   * Visitor of `Driver::eachNeighbor`.
   * @param peer neighbor address
   * @param po proximity order of `peer` to the local node
   * @return true to stop iteration
   */
  using NeighborVisitor =
      std::function<outcome::result<bool>(const Address &peer, uint8_t po)>;

  /**
   * View of the overlay around the local node.
   * Implementations must be safe for concurrent use.
   */
  class Driver {
   public:
    virtual ~Driver() = default;

    /**
     * Connected peer closest to `address`, ignoring peers in `skip`.
     * Yields `WantSelf` when the local node is closer than any candidate.
     */
    virtual outcome::result<ClosestPeer> closestPeer(
        const Address &address, std::span<const Address> skip) const = 0;

    /// Whether `address` falls within the local storage radius.
    virtual bool isWithinDepth(const Address &address) const = 0;

    /**
     * Visit neighbors of the local node, closest first.
     * Visitor error stops iteration and is returned.
     */
    virtual outcome::result<void> eachNeighbor(
        const NeighborVisitor &visit) const = 0;
  };

}  // namespace swarm::topology
