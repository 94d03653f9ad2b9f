/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <swarm/pricer/proximity_pricer.hpp>

#include <swarm/pricer/headers.hpp>

namespace swarm::pricer {

  ProximityPricer::ProximityPricer(Address self,
                                   std::shared_ptr<topology::Driver> topology,
                                   ProximityPricerConfig config)
      : self_{std::move(self)},
        topology_{std::move(topology)},
        config_{config} {}

  outcome::result<topology::ClosestPeer> ProximityPricer::cheapestPeer(
      const Address &address, std::span<const Address> skip) const {
    // the closest peer is the cheapest one under proximity pricing
    return topology_->closestPeer(address, skip);
  }

  Price ProximityPricer::peerPrice(const Address &peer,
                                   const Address &address) const {
    auto po = proximity(peer, address);
    std::lock_guard lock{mutex_};
    auto it = peer_tables_.find(peer);
    if (it != peer_tables_.end() and it->second.at(po).has_value()) {
      return *it->second.at(po);
    }
    return defaultPrice(po);
  }

  Price ProximityPricer::priceForPeer(const Address &,
                                      const Address &address) const {
    return defaultPrice(proximity(self_, address));
  }

  outcome::result<void> ProximityPricer::notifyPeerPrice(const Address &peer,
                                                         Price price,
                                                         uint64_t index) {
    if (index > kMaxPo) {
      return PricerError::INDEX_OUT_OF_RANGE;
    }
    SL_DEBUG(log_, "peer {} announced price {} at index {}", peer, price, index);
    std::lock_guard lock{mutex_};
    peer_tables_[peer].at(index) = price;
    return outcome::success();
  }

  Headers ProximityPricer::priceHeadler(const Headers &headers,
                                        const Address &peer) {
    auto parsed = parsePricingHeaders(headers);
    if (not parsed.has_value()) {
      SL_DEBUG(log_,
               "peer {} sent no pricing headers: {}",
               peer,
               parsed.error().message());
      return {};
    }
    auto &target = parsed.value().target;
    // a peer closer to the chunk than us replicates it, which is free
    auto cmp = distanceCmp(target, peer, self_);
    auto price = cmp.has_value() and cmp.value() == 1
                   ? Price{0}
                   : priceForPeer(peer, target);
    return makePricingResponseHeaders(price, target, proximity(self_, target));
  }

  Price ProximityPricer::defaultPrice(uint8_t po) const {
    return (kMaxPo - po + 1) * config_.base_price;
  }

}  // namespace swarm::pricer
