/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <functional>
#include <variant>

#include <qtils/enum_error_code.hpp>
#include <swarm/chunk/chunk.hpp>
#include <swarm/common/context.hpp>
#include <swarm/coro/coro.hpp>
#include <swarm/log/logger.hpp>
#include <swarm/network/protocol_spec.hpp>
#include <swarm/protocol/pushsync/config.hpp>
#include <swarm/topology/driver.hpp>

namespace boost::asio {
  class io_context;
}  // namespace boost::asio

namespace swarm::accounting {
  class Accounting;
}  // namespace swarm::accounting

namespace swarm::chunk {
  class Validator;
}  // namespace swarm::chunk

namespace swarm::crypto {
  class Signer;
}  // namespace swarm::crypto

namespace swarm::network {
  class Streamer;
}  // namespace swarm::network

namespace swarm::pricer {
  class Pricer;
}  // namespace swarm::pricer

namespace swarm::storage {
  class Putter;
}  // namespace swarm::storage

namespace swarm::tags {
  class Tags;
}  // namespace swarm::tags

namespace swarm::protocol::pushsync {
  constexpr std::string_view kProtocolName = "pushsync";
  constexpr std::string_view kProtocolVersion = "1.0.0";
  constexpr std::string_view kStreamName = "pushsync";

  enum class PushSyncError {
    WANT_SELF = 1,
    NO_PEER_FOUND,
    INVALID_CHUNK,
    INVALID_RECEIPT,
    OUT_OF_DEPTH_REPLICATION,
    REPLICATION_PRICE_MISMATCH,
  };

  Q_ENUM_ERROR_CODE(PushSyncError) {
    using E = decltype(e);
    switch (e) {
      case E::WANT_SELF:
        return "Local node is the closest to the chunk";
      case E::NO_PEER_FOUND:
        return "No peer found";
      case E::INVALID_CHUNK:
        return "Invalid chunk";
      case E::INVALID_RECEIPT:
        return "Receipt address does not match chunk";
      case E::OUT_OF_DEPTH_REPLICATION:
        return "Replication outside of the neighborhood";
      case E::REPLICATION_PRICE_MISMATCH:
        return "Neighbor asked a price for replication";
    }
    abort();
  }

  /// Proof that the node signing `address` stored the chunk.
  struct Receipt {
    Address address;
    Bytes signature;
  };

  using PushResult = std::variant<Receipt, topology::WantSelf, topology::NotFound>;

  struct Metrics {
    std::atomic<uint64_t> total_sent{0};
    std::atomic<uint64_t> total_received{0};
    std::atomic<uint64_t> total_errors{0};
    std::atomic<uint64_t> total_replicated{0};
    std::atomic<uint64_t> total_replicated_errors{0};
  };

  /**
   * Push chunks towards the nodes closest to their address and collect
   * signed receipts.
   *
   * Every node runs the same handler: it forwards a received chunk to its
   * own closest peer and relays the receipt back, or, when no peer is
   * closer than itself, stores the chunk, signs the receipt and replicates
   * the chunk to its neighbors.
   * Receipts are paid hop by hop through `accounting::Accounting`.
   */
  class PushSync : public std::enable_shared_from_this<PushSync> {
   public:
    PushSync(std::shared_ptr<boost::asio::io_context> io_context,
             Address self,
             std::shared_ptr<network::Streamer> streamer,
             std::shared_ptr<storage::Putter> storer,
             std::shared_ptr<topology::Driver> topology,
             std::shared_ptr<tags::Tags> tags,
             std::shared_ptr<pricer::Pricer> pricer,
             std::shared_ptr<accounting::Accounting> accounting,
             std::shared_ptr<crypto::Signer> signer,
             std::shared_ptr<chunk::Validator> validator,
             PushSyncConfig config);

    /// Handler and headler to register with the network.
    network::ProtocolSpec protocol();

    /// Called with every valid content-addressed chunk received.
    void setUnwrap(std::function<void(const Chunk &)> unwrap);

    /**
     * Deliver `chunk` to the closest peer and return its receipt.
     * Fails with `PushSyncError::WANT_SELF` when the local node is the
     * closest one.
     */
    CoroOutcome<Receipt> pushChunkToClosest(const Context &ctx,
                                            const Chunk &chunk);

    const Metrics &metrics() const {
      return metrics_;
    }

   private:
    CoroOutcome<PushResult> pushToClosest(const Context &ctx,
                                          const Chunk &chunk);

    CoroOutcome<void> handler(Address peer,
                              std::shared_ptr<connection::Stream> stream);

    CoroOutcome<void> handleDelivery(
        Address peer, std::shared_ptr<connection::Stream> stream);

    void replicate(const Chunk &chunk, const Address &upstream);

    CoroOutcome<void> pushToNeighbor(Chunk chunk, Address peer);

    std::shared_ptr<boost::asio::io_context> io_context_;
    Address self_;
    std::shared_ptr<network::Streamer> streamer_;
    std::shared_ptr<storage::Putter> storer_;
    std::shared_ptr<topology::Driver> topology_;
    std::shared_ptr<tags::Tags> tags_;
    std::shared_ptr<pricer::Pricer> pricer_;
    std::shared_ptr<accounting::Accounting> accounting_;
    std::shared_ptr<crypto::Signer> signer_;
    std::shared_ptr<chunk::Validator> validator_;
    PushSyncConfig config_;
    std::function<void(const Chunk &)> unwrap_;
    Metrics metrics_;
    log::Logger log_ = log::createLogger("PushSync", "pushsync");
  };
}  // namespace swarm::protocol::pushsync
