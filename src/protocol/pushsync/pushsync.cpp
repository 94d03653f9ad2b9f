/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <swarm/protocol/pushsync/pushsync.hpp>

#include <generated/protocol/pushsync/pushsync.pb.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <qtils/bytestr.hpp>
#include <swarm/accounting/accounting.hpp>
#include <swarm/accounting/reservation.hpp>
#include <swarm/basic/read_varint.hpp>
#include <swarm/basic/write_varint.hpp>
#include <swarm/chunk/validator.hpp>
#include <swarm/common/protobuf.hpp>
#include <swarm/common/weak_macro.hpp>
#include <swarm/connection/stream_deadline.hpp>
#include <swarm/coro/spawn.hpp>
#include <swarm/crypto/signer.hpp>
#include <swarm/network/streamer.hpp>
#include <swarm/pricer/headers.hpp>
#include <swarm/pricer/pricer.hpp>
#include <swarm/storage/putter.hpp>
#include <swarm/tags/tags.hpp>

namespace swarm::protocol::pushsync {
  namespace {
    /// Closes the stream in background on scope exit, unless it was reset.
    class StreamCloser {
     public:
      StreamCloser(boost::asio::io_context &io_context,
                   std::shared_ptr<connection::Stream> stream)
          : io_context_{io_context}, stream_{std::move(stream)} {}

      ~StreamCloser() {
        if (stream_->isClosed()) {
          return;
        }
        boost::asio::post(io_context_, [stream{std::move(stream_)}] {
          std::ignore = stream->close();
        });
      }

      StreamCloser(const StreamCloser &) = delete;
      StreamCloser &operator=(const StreamCloser &) = delete;

     private:
      boost::asio::io_context &io_context_;
      std::shared_ptr<connection::Stream> stream_;
    };

    Bytes toBytes(const std::string &str) {
      auto bytes = qtils::str2byte(str);
      return {bytes.begin(), bytes.end()};
    }

    swarm_pushsync_pb::Delivery makeDelivery(const Chunk &chunk) {
      swarm_pushsync_pb::Delivery pb_delivery;
      *pb_delivery.mutable_address() = qtils::byte2str(chunk.address.bytes());
      *pb_delivery.mutable_data() = qtils::byte2str(chunk.data);
      return pb_delivery;
    }

    template <typename T>
    CoroOutcome<void> writeMessage(std::shared_ptr<connection::Stream> stream,
                                   const T &pb_message) {
      auto encoded = protobufEncode(pb_message);
      co_return co_await writeVarintMessage(stream, encoded);
    }

    template <typename T>
    CoroOutcome<T> readMessage(std::shared_ptr<connection::Stream> stream,
                               size_t max_size) {
      Bytes encoded;
      BOOST_OUTCOME_CO_TRY(co_await readVarintMessage(stream, encoded, max_size));
      co_return protobufDecode<T>(encoded);
    }

    std::string streamPath() {
      return fmt::format(
          "/{}/{}/{}", kProtocolName, kProtocolVersion, kStreamName);
    }
  }  // namespace

  PushSync::PushSync(std::shared_ptr<boost::asio::io_context> io_context,
                     Address self,
                     std::shared_ptr<network::Streamer> streamer,
                     std::shared_ptr<storage::Putter> storer,
                     std::shared_ptr<topology::Driver> topology,
                     std::shared_ptr<tags::Tags> tags,
                     std::shared_ptr<pricer::Pricer> pricer,
                     std::shared_ptr<accounting::Accounting> accounting,
                     std::shared_ptr<crypto::Signer> signer,
                     std::shared_ptr<chunk::Validator> validator,
                     PushSyncConfig config)
      : io_context_{std::move(io_context)},
        self_{std::move(self)},
        streamer_{std::move(streamer)},
        storer_{std::move(storer)},
        topology_{std::move(topology)},
        tags_{std::move(tags)},
        pricer_{std::move(pricer)},
        accounting_{std::move(accounting)},
        signer_{std::move(signer)},
        validator_{std::move(validator)},
        config_{std::move(config)} {}

  network::ProtocolSpec PushSync::protocol() {
    // coroutine state keeps parameters, not the captures of its lambda
    auto handler = [WEAK_SELF](const Address &peer,
                               std::shared_ptr<connection::Stream> stream) {
      return [](std::weak_ptr<PushSync> weak_self,
                Address peer,
                std::shared_ptr<connection::Stream> stream)
                 -> CoroOutcome<void> {
        auto self = weak_self.lock();
        if (not self) {
          stream->reset();
          co_return connection::StreamError::RESET;
        }
        co_return co_await self->handler(std::move(peer), std::move(stream));
      }(weak_self, peer, std::move(stream));
    };
    auto headler = [pricer{pricer_}](const Headers &headers,
                                     const Address &peer) {
      return pricer->priceHeadler(headers, peer);
    };
    return {
        std::string{kProtocolName},
        std::string{kProtocolVersion},
        {network::StreamSpec{std::string{kStreamName}, handler, headler}},
    };
  }

  void PushSync::setUnwrap(std::function<void(const Chunk &)> unwrap) {
    unwrap_ = std::move(unwrap);
  }

  CoroOutcome<Receipt> PushSync::pushChunkToClosest(const Context &ctx,
                                                    const Chunk &chunk) {
    BOOST_OUTCOME_CO_TRY(auto pushed, co_await pushToClosest(ctx, chunk));
    if (auto receipt = std::get_if<Receipt>(&pushed)) {
      co_return std::move(*receipt);
    }
    if (std::holds_alternative<topology::WantSelf>(pushed)) {
      co_return PushSyncError::WANT_SELF;
    }
    co_return PushSyncError::NO_PEER_FOUND;
  }

  CoroOutcome<PushResult> PushSync::pushToClosest(const Context &ctx,
                                                  const Chunk &chunk) {
    std::vector<Address> skip;
    outcome::result<PushResult> last_error = PushResult{topology::NotFound{}};
    for (size_t i = 0; i < config_.max_peers; ++i) {
      BOOST_OUTCOME_CO_TRY(ctx.err());

      BOOST_OUTCOME_CO_TRY(auto closest,
                           pricer_->cheapestPeer(chunk.address, skip));
      if (std::holds_alternative<topology::WantSelf>(closest)) {
        co_return PushResult{topology::WantSelf{}};
      }
      if (std::holds_alternative<topology::NotFound>(closest)) {
        break;
      }
      auto peer = std::get<Address>(closest);
      // never attempted again, whatever happens next
      skip.emplace_back(peer);

      auto fail = [&](std::string_view what) {
        ++metrics_.total_errors;
        SL_ERROR(log_,
                 "{} chunk {} peer {}: {}",
                 what,
                 chunk.address,
                 peer,
                 last_error.error().message());
      };

      auto price = pricer_->peerPrice(peer, chunk.address);

      auto stream_result = co_await streamer_->newStream(
          ctx,
          peer,
          pricer::makePricingHeaders(price, chunk.address),
          std::string{kProtocolName},
          std::string{kProtocolVersion},
          std::string{kStreamName});
      if (not stream_result.has_value()) {
        last_error = stream_result.error();
        fail("new stream");
        continue;
      }
      auto &stream = stream_result.value();
      StreamCloser closer{*io_context_, stream};

      auto returned = pricer::parsePricingResponseHeaders(stream->headers());
      if (not returned.has_value()) {
        SL_DEBUG(log_,
                 "peer {} returned no pricing headers: {}",
                 peer,
                 returned.error().message());
        continue;
      }
      if (returned.value().price != price) {
        auto notified = pricer_->notifyPeerPrice(
            peer, returned.value().price, returned.value().index);
        if (not notified.has_value()) {
          SL_DEBUG(log_,
                   "notify price of peer {}: {}",
                   peer,
                   notified.error().message());
          continue;
        }
        auto previous_skip = std::span<const Address>{skip}.first(skip.size() - 1);
        auto cheapest = pricer_->cheapestPeer(chunk.address, previous_skip);
        if (cheapest.has_value()) {
          auto cheapest_peer = std::get_if<Address>(&cheapest.value());
          if (cheapest_peer == nullptr or *cheapest_peer != peer) {
            SL_DEBUG(log_,
                     "peer {} asked {} instead of {}, cheapest peer changed",
                     peer,
                     returned.value().price,
                     price);
            continue;
          }
        }
        price = returned.value().price;
      }

      auto reservation_result =
          accounting::Reservation::reserve(accounting_, ctx, peer, price);
      if (not reservation_result.has_value()) {
        SL_DEBUG(log_,
                 "reserve {} for peer {}: {}",
                 price,
                 peer,
                 reservation_result.error().message());
        co_return reservation_result.error();
      }
      auto reservation = std::move(reservation_result.value());

      auto delivery_ctx = ctx.withTimeout(config_.delivery_timeout);
      connection::StreamDeadline deadline{*io_context_, stream, delivery_ctx};

      auto written = co_await writeMessage(stream, makeDelivery(chunk));
      if (not written.has_value()) {
        stream->reset();
        last_error = written.error();
        fail("deliver");
        continue;
      }
      ++metrics_.total_sent;

      if (auto tag = tags_->get(chunk.tag_id)) {
        BOOST_OUTCOME_CO_TRY(tag->inc(tags::State::SENT));
      }

      auto pb_receipt = co_await readMessage<swarm_pushsync_pb::Receipt>(
          stream, config_.max_message_size);
      if (not pb_receipt.has_value()) {
        stream->reset();
        last_error = pb_receipt.error();
        fail("receive receipt");
        continue;
      }
      Receipt receipt{
          Address{qtils::str2byte(pb_receipt.value().address())},
          toBytes(pb_receipt.value().signature()),
      };
      if (receipt.address != chunk.address) {
        stream->reset();
        last_error = PushSyncError::INVALID_RECEIPT;
        fail("check receipt");
        continue;
      }

      // a receipt read after cancellation is not paid
      BOOST_OUTCOME_CO_TRY(ctx.err());
      BOOST_OUTCOME_CO_TRY(reservation.credit());
      co_return PushResult{std::move(receipt)};
    }

    SL_TRACE(log_,
             "chunk {}: attempted {} peers",
             chunk.address,
             skip.size());
    co_return last_error;
  }

  CoroOutcome<void> PushSync::handler(
      Address peer, std::shared_ptr<connection::Stream> stream) {
    auto result = co_await handleDelivery(peer, stream);
    if (not result.has_value()) {
      ++metrics_.total_errors;
      SL_DEBUG(log_,
               "{} from peer {}: {}",
               streamPath(),
               peer,
               result.error().message());
      stream->reset();
      co_return result;
    }
    auto closed = stream->close();
    if (not closed.has_value()) {
      SL_TRACE(log_, "close stream to peer {}: {}", peer, closed.error().message());
    }
    co_return outcome::success();
  }

  CoroOutcome<void> PushSync::handleDelivery(
      Address peer, std::shared_ptr<connection::Stream> stream) {
    auto ctx = Context{}.withTimeout(config_.time_to_live);
    connection::StreamDeadline deadline{*io_context_, stream, ctx};

    BOOST_OUTCOME_CO_TRY(auto pb_delivery,
                         co_await readMessage<swarm_pushsync_pb::Delivery>(
                             stream, config_.max_message_size));
    ++metrics_.total_received;

    Chunk chunk{
        Address{qtils::str2byte(pb_delivery.address())},
        toBytes(pb_delivery.data()),
    };

    if (validator_->isContentAddressed(chunk)) {
      if (unwrap_) {
        boost::asio::post(*io_context_,
                          [unwrap{unwrap_}, chunk] { unwrap(chunk); });
      }
    } else if (not validator_->isSingleOwner(chunk)) {
      co_return PushSyncError::INVALID_CHUNK;
    }

    // price of our receipt, answered by the headler when the stream was
    // accepted
    Price price = 0;
    if (auto parsed = pricer::parsePriceHeader(stream->responseHeaders())) {
      price = parsed.value();
    } else {
      SL_WARN(log_,
              "peer {} no price in previously issued response headers: {}",
              peer,
              parsed.error().message());
      price = pricer_->priceForPeer(peer, chunk.address);
    }

    BOOST_OUTCOME_CO_TRY(auto cmp, distanceCmp(chunk.address, peer, self_));
    if (cmp == 1) {
      // upstream is closer, we are a replication target
      if (not topology_->isWithinDepth(chunk.address)) {
        co_return PushSyncError::OUT_OF_DEPTH_REPLICATION;
      }
      auto stored = storer_->put(ctx, storage::ModePut::SYNC, chunk);
      if (not stored.has_value()) {
        SL_ERROR(log_, "chunk store: {}", stored.error().message());
      }
      co_return accounting_->debit(peer, price);
    }

    if (topology_->isWithinDepth(chunk.address)) {
      auto stored = storer_->put(ctx, storage::ModePut::SYNC, chunk);
      if (not stored.has_value()) {
        SL_WARN(log_,
                "within depth store of chunk {} failed: {}",
                chunk.address,
                stored.error().message());
      }
    }

    BOOST_OUTCOME_CO_TRY(auto pushed, co_await pushToClosest(ctx, chunk));
    Receipt receipt;
    if (auto forwarded = std::get_if<Receipt>(&pushed)) {
      receipt = std::move(*forwarded);
    } else if (std::holds_alternative<topology::WantSelf>(pushed)) {
      BOOST_OUTCOME_CO_TRY(
          storer_->put(ctx, storage::ModePut::SYNC, chunk));
      BOOST_OUTCOME_CO_TRY(auto signature,
                           signer_->sign(chunk.address.bytes()));
      replicate(chunk, peer);
      receipt = Receipt{chunk.address, std::move(signature)};
    } else {
      co_return PushSyncError::NO_PEER_FOUND;
    }

    swarm_pushsync_pb::Receipt pb_receipt;
    *pb_receipt.mutable_address() = qtils::byte2str(receipt.address.bytes());
    *pb_receipt.mutable_signature() = qtils::byte2str(receipt.signature);
    BOOST_OUTCOME_CO_TRY(co_await writeMessage(stream, pb_receipt));

    co_return accounting_->debit(peer, price);
  }

  void PushSync::replicate(const Chunk &chunk, const Address &upstream) {
    size_t count = 0;
    auto visited = topology_->eachNeighbor(
        [&](const Address &neighbor, uint8_t) -> outcome::result<bool> {
          if (neighbor == upstream) {
            return false;
          }
          if (count == config_.peers_to_replicate) {
            return true;
          }
          ++count;
          coroSpawn(*io_context_,
                    [WEAK_SELF, chunk, neighbor]() -> Coro<void> {
                      CO_WEAK_LOCK(self);
                      auto result =
                          co_await self->pushToNeighbor(chunk, neighbor);
                      if (not result.has_value()) {
                        ++self->metrics_.total_replicated_errors;
                        SL_TRACE(self->log_,
                                 "replicate chunk {} to peer {}: {}",
                                 chunk.address,
                                 neighbor,
                                 result.error().message());
                        co_return;
                      }
                      ++self->metrics_.total_replicated;
                      SL_TRACE(self->log_,
                               "replicated chunk {} to peer {}",
                               chunk.address,
                               neighbor);
                    });
          return false;
        });
    if (not visited.has_value()) {
      SL_TRACE(log_,
               "replication of chunk {}: {}",
               chunk.address,
               visited.error().message());
    }
  }

  CoroOutcome<void> PushSync::pushToNeighbor(Chunk chunk, Address peer) {
    // replication is not charged
    constexpr Price kReplicationPrice = 0;
    auto ctx = Context{}.withTimeout(config_.replication_timeout);
    BOOST_OUTCOME_CO_TRY(
        auto stream,
        co_await streamer_->newStream(
            ctx,
            peer,
            pricer::makePricingHeaders(kReplicationPrice, chunk.address),
            std::string{kProtocolName},
            std::string{kProtocolVersion},
            std::string{kStreamName}));
    auto result = co_await [&]() -> CoroOutcome<void> {
      BOOST_OUTCOME_CO_TRY(
          auto returned,
          pricer::parsePricingResponseHeaders(stream->headers()));
      if (returned.price != kReplicationPrice) {
        BOOST_OUTCOME_CO_TRY(
            pricer_->notifyPeerPrice(peer, returned.price, returned.index));
        co_return PushSyncError::REPLICATION_PRICE_MISMATCH;
      }
      connection::StreamDeadline deadline{*io_context_, stream, ctx};
      co_return co_await writeMessage(stream, makeDelivery(chunk));
    }();
    if (not result.has_value()) {
      stream->reset();
      co_return result;
    }
    co_return stream->close();
  }
}  // namespace swarm::protocol::pushsync
