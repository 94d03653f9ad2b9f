/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

namespace swarm::basic {

  /**
   * Incremental LEB128 decoder, fed one byte at a time.
   */
  class VarintPrefixReader {
   public:
    enum State : uint8_t {
      /// More bytes expected
      kUnderflow,
      /// Value decoded
      kReady,
      /// Value does not fit into uint64_t
      kOverflow,
    };

    State state() const {
      return state_;
    }

    uint64_t value() const {
      return value_;
    }

    State consume(uint8_t byte) {
      if (state_ != kUnderflow) {
        return state_;
      }
      // 10th byte may only carry the highest bit of uint64_t
      if (got_bytes_ == 9 and (byte & 0x7f) > 1) {
        state_ = kOverflow;
        return state_;
      }
      value_ |= static_cast<uint64_t>(byte & 0x7f) << (7 * got_bytes_);
      ++got_bytes_;
      if ((byte & 0x80) == 0) {
        state_ = kReady;
      } else if (got_bytes_ == 10) {
        state_ = kOverflow;
      }
      return state_;
    }

   private:
    uint64_t value_ = 0;
    uint8_t got_bytes_ = 0;
    State state_ = kUnderflow;
  };

}  // namespace swarm::basic
