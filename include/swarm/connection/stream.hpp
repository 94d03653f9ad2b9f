/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>
#include <swarm/basic/readwriter.hpp>
#include <swarm/common/address.hpp>
#include <swarm/network/headers.hpp>

namespace swarm::connection {

  enum class StreamError {
    CLOSED = 1,
    RESET,
  };

  Q_ENUM_ERROR_CODE(StreamError) {
    using E = decltype(e);
    switch (e) {
      case E::CLOSED:
        return "Stream closed";
      case E::RESET:
        return "Stream reset";
    }
    abort();
  }

  /**
   * Bidirectional stream to a single peer, opened for one protocol stream.
   * @note the user MUST WAIT for the completion of `readSome` before calling
   * it again, same for `writeSome`; reading and writing may overlap.
   */
  struct Stream : public basic::ReadWriter {
    ~Stream() override = default;

    /**
     * Close our side gracefully, the peer reads end of stream after data
     * already written.
     */
    virtual outcome::result<void> close() = 0;

    /**
     * Abort stream in both directions; pending and further reads and writes
     * fail with `StreamError::RESET`.
     */
    virtual void reset() = 0;

    virtual bool isClosed() const = 0;

    virtual const Address &remotePeer() const = 0;

    /**
     * Headers received from the peer: its answer on a stream we opened, its
     * request on a stream we accepted.
     */
    virtual const Headers &headers() const = 0;

    /**
     * Headers we returned to the peer when accepting its stream, empty on a
     * stream we opened.
     */
    virtual const Headers &responseHeaders() const = 0;
  };
}  // namespace swarm::connection
