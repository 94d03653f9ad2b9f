/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <deque>
#include <unordered_map>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <swarm/log/logger.hpp>
#include <swarm/network/protocol_spec.hpp>
#include <swarm/network/streamer.hpp>

namespace swarm::network {

  /**
   * One end of an in-process stream pair.
   * Both ends must be used from the thread running the `io_context`.
   */
  class InmemStream : public connection::Stream {
   public:
    /// One direction of the pair.
    struct Pipe {
      explicit Pipe(boost::asio::io_context &io_context)
          : signal{io_context, boost::asio::steady_timer::time_point::max()} {
      }

      void notify() {
        signal.cancel();
      }

      std::deque<uint8_t> buffer;
      bool eof = false;
      bool reset = false;
      /// Wakes up the reader waiting on this pipe.
      boost::asio::steady_timer signal;
    };

    InmemStream(Address remote_peer,
                std::shared_ptr<Pipe> in,
                std::shared_ptr<Pipe> out,
                Headers headers,
                Headers response_headers);

    /**
     * Connected streams for `initiator` opening a stream to `acceptor` with
     * `request` headers, answered with `response` headers.
     * @return initiator end, acceptor end
     */
    static std::pair<std::shared_ptr<InmemStream>, std::shared_ptr<InmemStream>>
    pair(boost::asio::io_context &io_context,
         const Address &initiator,
         const Address &acceptor,
         Headers request,
         Headers response);

    CoroOutcome<size_t> readSome(BytesOut out) override;
    CoroOutcome<size_t> writeSome(BytesIn in) override;
    outcome::result<void> close() override;
    void reset() override;
    bool isClosed() const override;
    const Address &remotePeer() const override;
    const Headers &headers() const override;
    const Headers &responseHeaders() const override;

   private:
    Address remote_peer_;
    std::shared_ptr<Pipe> in_;
    std::shared_ptr<Pipe> out_;
    Headers headers_;
    Headers response_headers_;
  };

  /**
   * Nodes of a single process connected to each other.
   * Opening a stream runs the acceptor's headler synchronously and spawns
   * its handler on the shared `io_context`.
   */
  class InmemNetwork : public std::enable_shared_from_this<InmemNetwork> {
   public:
    explicit InmemNetwork(std::shared_ptr<boost::asio::io_context> io_context);

    /// Make `peer` reachable and serve `protocol` on it.
    void addProtocol(const Address &peer, ProtocolSpec protocol);

    /// Disconnect `peer`, opening streams to it fails afterwards.
    void removeNode(const Address &peer);

    /// Streamer opening streams on behalf of `local`.
    std::shared_ptr<Streamer> streamer(const Address &local);

    CoroOutcome<std::shared_ptr<connection::Stream>> newStream(
        const Context &ctx,
        const Address &local,
        const Address &peer,
        Headers headers,
        const std::string &protocol,
        const std::string &version,
        const std::string &stream);

   private:
    std::shared_ptr<boost::asio::io_context> io_context_;
    std::unordered_map<Address, std::vector<ProtocolSpec>> nodes_;
    log::Logger log_ = log::createLogger("InmemNetwork", "network");
  };

}  // namespace swarm::network
