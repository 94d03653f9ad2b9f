/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <swarm/network/inmem_network.hpp>

#include <algorithm>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <swarm/coro/spawn.hpp>

namespace swarm::network {
  using connection::StreamError;

  namespace {
    class NodeStreamer : public Streamer {
     public:
      NodeStreamer(std::shared_ptr<InmemNetwork> network, Address local)
          : network_{std::move(network)}, local_{std::move(local)} {}

      CoroOutcome<std::shared_ptr<connection::Stream>> newStream(
          const Context &ctx,
          const Address &peer,
          Headers headers,
          const std::string &protocol,
          const std::string &version,
          const std::string &stream) override {
        co_return co_await network_->newStream(
            ctx, local_, peer, std::move(headers), protocol, version, stream);
      }

     private:
      std::shared_ptr<InmemNetwork> network_;
      Address local_;
    };
  }  // namespace

  InmemStream::InmemStream(Address remote_peer,
                           std::shared_ptr<Pipe> in,
                           std::shared_ptr<Pipe> out,
                           Headers headers,
                           Headers response_headers)
      : remote_peer_{std::move(remote_peer)},
        in_{std::move(in)},
        out_{std::move(out)},
        headers_{std::move(headers)},
        response_headers_{std::move(response_headers)} {}

  std::pair<std::shared_ptr<InmemStream>, std::shared_ptr<InmemStream>>
  InmemStream::pair(boost::asio::io_context &io_context,
                    const Address &initiator,
                    const Address &acceptor,
                    Headers request,
                    Headers response) {
    auto forward = std::make_shared<Pipe>(io_context);
    auto backward = std::make_shared<Pipe>(io_context);
    auto initiator_end =
        std::make_shared<InmemStream>(acceptor, backward, forward, response, Headers{});
    auto acceptor_end = std::make_shared<InmemStream>(initiator,
                                                      forward,
                                                      backward,
                                                      std::move(request),
                                                      std::move(response));
    return {std::move(initiator_end), std::move(acceptor_end)};
  }

  CoroOutcome<size_t> InmemStream::readSome(BytesOut out) {
    // keep pipe alive if the stream is dropped while suspended
    auto in = in_;
    while (true) {
      if (in->reset) {
        co_return StreamError::RESET;
      }
      if (not in->buffer.empty()) {
        auto n = std::min(out.size(), in->buffer.size());
        std::copy_n(in->buffer.begin(), n, out.begin());
        in->buffer.erase(in->buffer.begin(), in->buffer.begin() + n);
        co_return n;
      }
      if (in->eof) {
        co_return StreamError::CLOSED;
      }
      in->signal.expires_at(boost::asio::steady_timer::time_point::max());
      boost::system::error_code ec;
      co_await in->signal.async_wait(
          boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
  }

  CoroOutcome<size_t> InmemStream::writeSome(BytesIn in) {
    if (out_->reset) {
      co_return StreamError::RESET;
    }
    if (out_->eof) {
      co_return StreamError::CLOSED;
    }
    out_->buffer.insert(out_->buffer.end(), in.begin(), in.end());
    out_->notify();
    co_return in.size();
  }

  outcome::result<void> InmemStream::close() {
    if (out_->reset) {
      return StreamError::RESET;
    }
    out_->eof = true;
    out_->notify();
    return outcome::success();
  }

  void InmemStream::reset() {
    for (auto &pipe : {in_, out_}) {
      pipe->reset = true;
      pipe->notify();
    }
  }

  bool InmemStream::isClosed() const {
    return out_->eof or out_->reset;
  }

  const Address &InmemStream::remotePeer() const {
    return remote_peer_;
  }

  const Headers &InmemStream::headers() const {
    return headers_;
  }

  const Headers &InmemStream::responseHeaders() const {
    return response_headers_;
  }

  InmemNetwork::InmemNetwork(
      std::shared_ptr<boost::asio::io_context> io_context)
      : io_context_{std::move(io_context)} {}

  void InmemNetwork::addProtocol(const Address &peer, ProtocolSpec protocol) {
    nodes_[peer].emplace_back(std::move(protocol));
  }

  void InmemNetwork::removeNode(const Address &peer) {
    nodes_.erase(peer);
  }

  std::shared_ptr<Streamer> InmemNetwork::streamer(const Address &local) {
    return std::make_shared<NodeStreamer>(shared_from_this(), local);
  }

  CoroOutcome<std::shared_ptr<connection::Stream>> InmemNetwork::newStream(
      const Context &ctx,
      const Address &local,
      const Address &peer,
      Headers headers,
      const std::string &protocol,
      const std::string &version,
      const std::string &stream) {
    BOOST_OUTCOME_CO_TRY(ctx.err());
    auto node_it = nodes_.find(peer);
    if (node_it == nodes_.end()) {
      co_return StreamerError::PEER_NOT_CONNECTED;
    }
    const StreamSpec *stream_spec = nullptr;
    for (auto &spec : node_it->second) {
      if (spec.name != protocol or spec.version != version) {
        continue;
      }
      for (auto &candidate : spec.stream_specs) {
        if (candidate.name == stream) {
          stream_spec = &candidate;
        }
      }
    }
    if (stream_spec == nullptr) {
      co_return StreamerError::PROTOCOL_NOT_SUPPORTED;
    }
    SL_TRACE(log_,
             "stream /{}/{}/{} {} -> {}",
             protocol,
             version,
             stream,
             local,
             peer);
    Headers response;
    if (stream_spec->headler) {
      response = stream_spec->headler(headers, local);
    }
    auto [local_end, remote_end] = InmemStream::pair(
        *io_context_, local, peer, std::move(headers), std::move(response));
    coroSpawn(*io_context_,
              [handler{stream_spec->handler},
               local,
               remote_end{std::move(remote_end)}]() -> CoroOutcome<void> {
                co_return co_await handler(local, remote_end);
              });
    co_return local_end;
  }

}  // namespace swarm::network
