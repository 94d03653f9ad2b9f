/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>
#include <qtils/bytestr.hpp>
#include <swarm/common/sample_node.hpp>
#include <swarm/injector/pushsync_injector.hpp>
#include <swarm/network/inmem_network.hpp>
#include <swarm/topology/static_topology.hpp>

#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/run_coro.hpp"

using namespace swarm;
using protocol::pushsync::PushSync;
using protocol::pushsync::PushSyncConfig;
using protocol::pushsync::PushSyncError;

namespace {
  constexpr size_t kNodes = 8;

  struct Node {
    SampleNode sample;
    std::shared_ptr<storage::InmemStore> store;
    std::shared_ptr<accounting::InmemAccounting> accounting;
    std::shared_ptr<PushSync> pushsync;
  };
}  // namespace

/**
 * Fully connected nodes built by the injector, each one a neighbor of
 * every other one.
 */
class PushSyncNetworkTest : public ::testing::Test {
 public:
  static void SetUpTestSuite() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    auto text = qtils::str2byte(std::string_view{"pushed over the network"});
    chunk = chunk::makeContentAddressed({text.begin(), text.end()});

    std::vector<std::shared_ptr<topology::StaticTopology>> topologies;
    for (size_t i = 0; i < kNodes; ++i) {
      SampleNode sample{i};
      auto topology =
          std::make_shared<topology::StaticTopology>(sample.address, 0);
      auto store = std::make_shared<storage::InmemStore>();
      auto accounting = std::make_shared<accounting::InmemAccounting>(
          accounting::InmemAccountingConfig{});
      auto injector = injector::makePushSyncInjector(
          boost::di::bind<boost::asio::io_context>().to(io_context),
          injector::useSelfAddress(sample.address),
          boost::di::bind<network::Streamer>().to(
              network->streamer(sample.address)),
          boost::di::bind<topology::Driver>().to(topology),
          boost::di::bind<crypto::Signer>().to(sample.signer),
          boost::di::bind<storage::Putter>().to(store)[boost::di::override],
          boost::di::bind<accounting::Accounting>().to(
              accounting)[boost::di::override]);
      auto pushsync = injector.create<std::shared_ptr<PushSync>>();
      network->addProtocol(sample.address, pushsync->protocol());
      topologies.emplace_back(topology);
      nodes.emplace_back(Node{sample, store, accounting, pushsync});
    }
    for (auto &topology : topologies) {
      for (auto &node : nodes) {
        topology->addPeer(node.sample.address);
      }
    }

    closest = &nodes.front();
    for (auto &node : nodes) {
      auto cmp = distanceCmp(
          chunk.address, node.sample.address, closest->sample.address);
      if (cmp.value() == 1) {
        closest = &node;
      }
    }
    origin = closest == &nodes.front() ? &nodes.back() : &nodes.front();
  }

  outcome::result<protocol::pushsync::Receipt> push(Node &node) {
    return testutil::runCoro(*io_context,
                             node.pushsync->pushChunkToClosest({}, chunk));
  }

  size_t storedCount() const {
    return std::ranges::count_if(
        nodes, [&](const Node &node) { return node.store->has(chunk.address); });
  }

  std::shared_ptr<boost::asio::io_context> io_context =
      std::make_shared<boost::asio::io_context>();
  std::shared_ptr<network::InmemNetwork> network =
      std::make_shared<network::InmemNetwork>(io_context);
  Chunk chunk;
  std::vector<Node> nodes;
  Node *closest = nullptr;
  Node *origin = nullptr;
};

/**
 * @given chunk pushed from a node that is not the closest
 * @when the push completes
 * @then the receipt is signed by the closest node, which stored the chunk
 * and replicated it to its neighbors
 */
TEST_F(PushSyncNetworkTest, ReceiptSignedByClosestNode) {
  ASSERT_OUTCOME_SUCCESS(receipt, push(*origin));
  EXPECT_EQ(receipt.address, chunk.address);
  ASSERT_OUTCOME_SUCCESS(
      signed_by_closest,
      crypto::secp256k1::Secp256k1Signer::verify(
          chunk.address.bytes(),
          receipt.signature,
          closest->sample.signer->publicKey()));
  EXPECT_TRUE(signed_by_closest);
  ASSERT_OUTCOME_SUCCESS(
      signed_by_origin,
      crypto::secp256k1::Secp256k1Signer::verify(
          chunk.address.bytes(),
          receipt.signature,
          origin->sample.signer->publicKey()));
  EXPECT_FALSE(signed_by_origin);

  EXPECT_TRUE(closest->store->has(chunk.address));
  EXPECT_FALSE(origin->store->has(chunk.address));
  // closest node and its replicas
  EXPECT_EQ(storedCount(), 1 + PushSyncConfig{}.peers_to_replicate);
  EXPECT_EQ(closest->pushsync->metrics().total_replicated.load(),
            PushSyncConfig{}.peers_to_replicate);
}

TEST_F(PushSyncNetworkTest, ReceiptPaidHopByHop) {
  EXPECT_OUTCOME_SUCCESS(push(*origin));
  auto paid = origin->accounting->balance(closest->sample.address);
  EXPECT_LT(paid, 0);
  EXPECT_EQ(closest->accounting->balance(origin->sample.address), -paid);
  EXPECT_EQ(origin->accounting->reserved(closest->sample.address), 0);
}

TEST_F(PushSyncNetworkTest, ClosestNodeWantsSelf) {
  EXPECT_OUTCOME_ERROR(PushSyncError::WANT_SELF, push(*closest));
  EXPECT_EQ(storedCount(), 0);
}
