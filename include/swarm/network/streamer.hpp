/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>

#include <qtils/enum_error_code.hpp>
#include <swarm/common/context.hpp>
#include <swarm/connection/stream.hpp>

namespace swarm::network {

  enum class StreamerError {
    PEER_NOT_CONNECTED = 1,
    PROTOCOL_NOT_SUPPORTED,
  };

  Q_ENUM_ERROR_CODE(StreamerError) {
    using E = decltype(e);
    switch (e) {
      case E::PEER_NOT_CONNECTED:
        return "Peer is not connected";
      case E::PROTOCOL_NOT_SUPPORTED:
        return "Peer does not support protocol stream";
    }
    abort();
  }

  /**
   * Opens protocol streams to connected peers.
   */
  class Streamer {
   public:
    virtual ~Streamer() = default;

    /**
     * Open stream `stream` of protocol `protocol`/`version` to `peer`,
     * sending `headers`.
     * The returned stream exposes the headers the peer answered with.
     */
    virtual CoroOutcome<std::shared_ptr<connection::Stream>> newStream(
        const Context &ctx,
        const Address &peer,
        Headers headers,
        const std::string &protocol,
        const std::string &version,
        const std::string &stream) = 0;
  };

}  // namespace swarm::network
