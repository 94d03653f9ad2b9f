/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <swarm/network/headers.hpp>
#include <swarm/topology/driver.hpp>

namespace swarm::pricer {

  /**
   * Prices of receipts, both the ones we pay to peers and the ones we charge
   * them.
   */
  class Pricer {
   public:
    virtual ~Pricer() = default;

    /// Cheapest eligible peer to deliver `address` to, ignoring `skip`.
    virtual outcome::result<topology::ClosestPeer> cheapestPeer(
        const Address &address, std::span<const Address> skip) const = 0;

    /// Price we expect to pay `peer` for a receipt of `address`.
    virtual Price peerPrice(const Address &peer,
                            const Address &address) const = 0;

    /// Price we charge `peer` for a receipt of `address`.
    virtual Price priceForPeer(const Address &peer,
                               const Address &address) const = 0;

    /// Record the price `peer` answered with for table row `index`.
    virtual outcome::result<void> notifyPeerPrice(const Address &peer,
                                                  Price price,
                                                  uint64_t index) = 0;

    /// Response headers for a pricing request of `peer`.
    virtual Headers priceHeadler(const Headers &headers,
                                 const Address &peer) = 0;
  };

}  // namespace swarm::pricer
