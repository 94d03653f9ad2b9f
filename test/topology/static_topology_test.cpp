/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>
#include <swarm/topology/static_topology.hpp>

#include "testutil/addresses.hpp"
#include "testutil/outcome.hpp"

using namespace swarm;
using namespace swarm::topology;
using testutil::makeAddress;

class StaticTopologyTest : public ::testing::Test {
 public:
  Address self = makeAddress(0x00);
  StaticTopology topology{self, 1};
};

TEST_F(StaticTopologyTest, NoPeersWantsSelf) {
  ASSERT_OUTCOME_SUCCESS(closest, topology.closestPeer(makeAddress(0xff), {}));
  EXPECT_TRUE(std::holds_alternative<WantSelf>(closest));
}

TEST_F(StaticTopologyTest, ClosestPeerSkipping) {
  topology.addPeer(makeAddress(0xf0));
  topology.addPeer(makeAddress(0xc0));
  topology.addPeer(makeAddress(0x80));
  auto chunk = makeAddress(0xf1);

  ASSERT_OUTCOME_SUCCESS(first, topology.closestPeer(chunk, {}));
  EXPECT_EQ(first, ClosestPeer{makeAddress(0xf0)});

  std::vector<Address> skip{makeAddress(0xf0)};
  ASSERT_OUTCOME_SUCCESS(second, topology.closestPeer(chunk, skip));
  EXPECT_EQ(second, ClosestPeer{makeAddress(0xc0)});

  skip.emplace_back(makeAddress(0xc0));
  skip.emplace_back(makeAddress(0x80));
  ASSERT_OUTCOME_SUCCESS(none, topology.closestPeer(chunk, skip));
  EXPECT_TRUE(std::holds_alternative<NotFound>(none));
}

TEST_F(StaticTopologyTest, SelfCloserThanPeers) {
  topology.addPeer(makeAddress(0x80));
  ASSERT_OUTCOME_SUCCESS(closest, topology.closestPeer(makeAddress(0x01), {}));
  EXPECT_TRUE(std::holds_alternative<WantSelf>(closest));
}

/**
 * @given all peers closer than self already skipped
 * @when asking for the closest peer
 * @then self is the closest remaining node
 */
TEST_F(StaticTopologyTest, SelfCloserThanRemainingPeers) {
  topology.addPeer(makeAddress(0x01));
  topology.addPeer(makeAddress(0x80));
  std::vector<Address> skip{makeAddress(0x01)};
  ASSERT_OUTCOME_SUCCESS(closest,
                         topology.closestPeer(makeAddress(0x02), skip));
  EXPECT_TRUE(std::holds_alternative<WantSelf>(closest));
}

TEST_F(StaticTopologyTest, AddRemove) {
  topology.addPeer(self);
  topology.addPeer(makeAddress(0x80));
  topology.addPeer(makeAddress(0x80));
  topology.removePeer(makeAddress(0x80));
  ASSERT_OUTCOME_SUCCESS(closest, topology.closestPeer(makeAddress(0xff), {}));
  EXPECT_TRUE(std::holds_alternative<WantSelf>(closest));
}

TEST_F(StaticTopologyTest, WithinDepth) {
  EXPECT_TRUE(topology.isWithinDepth(makeAddress(0x7f)));
  EXPECT_FALSE(topology.isWithinDepth(makeAddress(0x80)));
  topology.setDepth(0);
  EXPECT_TRUE(topology.isWithinDepth(makeAddress(0x80)));
}

TEST_F(StaticTopologyTest, EachNeighborDeepestFirst) {
  topology.addPeer(makeAddress(0x80));  // po 0, outside depth
  topology.addPeer(makeAddress(0x40));  // po 1
  topology.addPeer(makeAddress(0x01));  // po 7
  topology.addPeer(makeAddress(0x20));  // po 2

  std::vector<std::pair<Address, uint8_t>> visited;
  EXPECT_OUTCOME_SUCCESS(
      topology.eachNeighbor([&](const Address &peer, uint8_t po) {
        visited.emplace_back(peer, po);
        return outcome::result<bool>{false};
      }));
  ASSERT_EQ(visited.size(), 3);
  EXPECT_EQ(visited[0], std::make_pair(makeAddress(0x01), uint8_t{7}));
  EXPECT_EQ(visited[1], std::make_pair(makeAddress(0x20), uint8_t{2}));
  EXPECT_EQ(visited[2], std::make_pair(makeAddress(0x40), uint8_t{1}));
}

TEST_F(StaticTopologyTest, EachNeighborStops) {
  topology.addPeer(makeAddress(0x40));
  topology.addPeer(makeAddress(0x20));
  size_t visits = 0;
  EXPECT_OUTCOME_SUCCESS(topology.eachNeighbor([&](const Address &, uint8_t) {
    ++visits;
    return outcome::result<bool>{true};
  }));
  EXPECT_EQ(visits, 1);
}
