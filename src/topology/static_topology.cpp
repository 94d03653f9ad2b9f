/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <swarm/topology/static_topology.hpp>

#include <algorithm>

namespace swarm::topology {

  StaticTopology::StaticTopology(Address self, uint8_t depth)
      : self_{std::move(self)}, depth_{depth} {}

  void StaticTopology::addPeer(const Address &peer) {
    std::lock_guard lock{mutex_};
    if (peer == self_ or std::ranges::find(peers_, peer) != peers_.end()) {
      return;
    }
    peers_.emplace_back(peer);
  }

  void StaticTopology::removePeer(const Address &peer) {
    std::lock_guard lock{mutex_};
    std::erase(peers_, peer);
  }

  void StaticTopology::setDepth(uint8_t depth) {
    std::lock_guard lock{mutex_};
    depth_ = depth;
  }

  outcome::result<ClosestPeer> StaticTopology::closestPeer(
      const Address &address, std::span<const Address> skip) const {
    std::lock_guard lock{mutex_};
    if (peers_.empty()) {
      return WantSelf{};
    }
    const Address *closest = nullptr;
    for (auto &peer : peers_) {
      if (std::ranges::find(skip, peer) != skip.end()) {
        continue;
      }
      if (closest == nullptr) {
        closest = &peer;
        continue;
      }
      OUTCOME_TRY(cmp, distanceCmp(address, peer, *closest));
      if (cmp == 1) {
        closest = &peer;
      }
    }
    if (closest == nullptr) {
      return NotFound{};
    }
    OUTCOME_TRY(cmp, distanceCmp(address, self_, *closest));
    if (cmp == 1) {
      return WantSelf{};
    }
    return *closest;
  }

  bool StaticTopology::isWithinDepth(const Address &address) const {
    std::lock_guard lock{mutex_};
    return proximity(self_, address) >= depth_;
  }

  outcome::result<void> StaticTopology::eachNeighbor(
      const NeighborVisitor &visit) const {
    std::vector<std::pair<uint8_t, Address>> neighbors;
    {
      std::lock_guard lock{mutex_};
      for (auto &peer : peers_) {
        auto po = proximity(self_, peer);
        if (po >= depth_) {
          neighbors.emplace_back(po, peer);
        }
      }
    }
    std::ranges::stable_sort(neighbors, std::greater{}, [](auto &neighbor) {
      return neighbor.first;
    });
    for (auto &[po, peer] : neighbors) {
      OUTCOME_TRY(stop, visit(peer, po));
      if (stop) {
        break;
      }
    }
    return outcome::success();
  }

}  // namespace swarm::topology
