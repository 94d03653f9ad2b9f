/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

#include <swarm/log/logger.hpp>
#include <swarm/pricer/pricer.hpp>

namespace swarm::pricer {

  enum class PricerError {
    INDEX_OUT_OF_RANGE = 1,
  };

  Q_ENUM_ERROR_CODE(PricerError) {
    using E = decltype(e);
    switch (e) {
      case E::INDEX_OUT_OF_RANGE:
        return "Price table index out of range";
    }
    abort();
  }

  struct ProximityPricerConfig {
    // Fixes default field values with boost::di.
    ProximityPricerConfig() = default;

    /// Price of one proximity order step.
    Price base_price = 10;
  };

  /**
   * Receipt price grows with the distance between the storing node and the
   * chunk: `(kMaxPo - po + 1) * base_price`.
   * Prices announced by peers override the table of that peer row by row.
   * Replication by a peer closer to the chunk than the local node is free.
   */
  class ProximityPricer : public Pricer {
   public:
    ProximityPricer(Address self,
                    std::shared_ptr<topology::Driver> topology,
                    ProximityPricerConfig config);

    outcome::result<topology::ClosestPeer> cheapestPeer(
        const Address &address, std::span<const Address> skip) const override;

    Price peerPrice(const Address &peer,
                    const Address &address) const override;

    Price priceForPeer(const Address &peer,
                       const Address &address) const override;

    outcome::result<void> notifyPeerPrice(const Address &peer,
                                          Price price,
                                          uint64_t index) override;

    Headers priceHeadler(const Headers &headers, const Address &peer) override;

   private:
    using PriceTable = std::array<std::optional<Price>, kMaxPo + 1>;

    Price defaultPrice(uint8_t po) const;

    Address self_;
    std::shared_ptr<topology::Driver> topology_;
    ProximityPricerConfig config_;
    mutable std::mutex mutex_;
    std::unordered_map<Address, PriceTable> peer_tables_;
    log::Logger log_ = log::createLogger("Pricer", "pricer");
  };

}  // namespace swarm::pricer
