/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdlib>
#include <filesystem>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <fmt/format.h>
#include <qtils/bytestr.hpp>
#include <swarm/common/sample_node.hpp>
#include <swarm/coro/spawn.hpp>
#include <swarm/injector/pushsync_injector.hpp>
#include <swarm/log/simple.hpp>
#include <swarm/network/inmem_network.hpp>
#include <swarm/topology/static_topology.hpp>

// Example: push a chunk through a network of in-process nodes
// How to run:
//   ./pushsync_example [node count] [logging config yaml]
// Node 0 pushes one chunk; the closest node stores it, signs the receipt
// and replicates the chunk to its neighbors.

namespace {
  // Nodes sharing the first bit of their addresses are neighbors.
  constexpr uint8_t kDepth = 1;

  struct Node {
    swarm::SampleNode sample;
    std::shared_ptr<swarm::topology::StaticTopology> topology;
    std::shared_ptr<swarm::storage::InmemStore> store;
    std::shared_ptr<swarm::protocol::pushsync::PushSync> pushsync;
  };

  void configureLogging(int argc, char **argv) {
    if (argc < 3) {
      swarm::simpleLoggingSystem();
      return;
    }
    auto logsys = std::make_shared<soralog::LoggingSystem>(
        std::make_shared<swarm::log::Configurator>(
            std::filesystem::path{argv[2]}));
    auto r = logsys->configure();
    if (r.has_error) {
      fmt::print(stderr, "soralog: {}\n", r.message);
      exit(EXIT_FAILURE);
    }
    swarm::log::setLoggingSystem(logsys);
  }
}  // namespace

int main(int argc, char **argv) {
  configureLogging(argc, argv);
  auto log = swarm::log::createLogger("example");

  size_t count = argc > 1 ? std::stoul(argv[1]) : 8;
  if (count < 2) {
    fmt::print("usage: pushsync_example [node count >= 2] [logging config]\n");
    return EXIT_FAILURE;
  }

  auto io_context = std::make_shared<boost::asio::io_context>();
  auto network = std::make_shared<swarm::network::InmemNetwork>(io_context);

  // Every node gets its own injector, so its own ledger, store and pricer.
  std::vector<Node> nodes;
  for (size_t i = 0; i < count; ++i) {
    swarm::SampleNode sample{i};
    auto topology = std::make_shared<swarm::topology::StaticTopology>(
        sample.address, kDepth);
    auto store = std::make_shared<swarm::storage::InmemStore>();
    auto injector = swarm::injector::makePushSyncInjector(
        boost::di::bind<boost::asio::io_context>().to(io_context),
        swarm::injector::useSelfAddress(sample.address),
        boost::di::bind<swarm::network::Streamer>().to(
            network->streamer(sample.address)),
        boost::di::bind<swarm::topology::Driver>().to(topology),
        boost::di::bind<swarm::crypto::Signer>().to(sample.signer),
        boost::di::bind<swarm::storage::Putter>().to(
            store)[boost::di::override]);
    auto pushsync =
        injector
            .create<std::shared_ptr<swarm::protocol::pushsync::PushSync>>();
    network->addProtocol(sample.address, pushsync->protocol());
    log->info("node {} address {}", i, sample.address);
    nodes.emplace_back(Node{sample, topology, store, pushsync});
  }

  // Full mesh.
  for (auto &node : nodes) {
    for (auto &peer : nodes) {
      node.topology->addPeer(peer.sample.address);
    }
  }

  auto text = qtils::str2byte(std::string_view{"hello swarm"});
  auto chunk = swarm::chunk::makeContentAddressed({text.begin(), text.end()});
  log->info("push chunk {} from node 0", chunk.address);

  swarm::coroSpawn(*io_context, [&]() -> swarm::Coro<void> {
    auto ctx = swarm::Context{}.withTimeout(std::chrono::seconds{10});
    auto receipt =
        co_await nodes.front().pushsync->pushChunkToClosest(ctx, chunk);
    if (not receipt.has_value()) {
      log->error("push failed: {}", receipt.error().message());
    } else {
      for (auto &node : nodes) {
        auto verified = swarm::crypto::secp256k1::Secp256k1Signer::verify(
            chunk.address.bytes(),
            receipt.value().signature,
            node.sample.signer->publicKey());
        if (verified.has_value() and verified.value()) {
          log->info("receipt signed by node {}", node.sample.index);
        }
      }
    }

    // let replication finish
    boost::asio::steady_timer timer{*io_context};
    timer.expires_after(std::chrono::seconds{1});
    co_await timer.async_wait(boost::asio::use_awaitable);
    for (auto &node : nodes) {
      log->info("node {}: stored {}, replicated {}, errors {}",
                node.sample.index,
                node.store->has(chunk.address),
                node.pushsync->metrics().total_replicated.load(),
                node.pushsync->metrics().total_errors.load());
    }
    io_context->stop();
  });

  io_context->run();
  return EXIT_SUCCESS;
}
