/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>

#include <swarm/common/types.hpp>

namespace swarm {
  /**
   * Unsigned LEB128 encoding of a length prefix, kept in a fixed buffer.
   */
  class EncodeVarint {
   public:
    EncodeVarint(uint64_t value) {
      do {
        uint8_t byte = value & 0x7f;
        value >>= 7;
        if (value != 0) {
          byte |= 0x80;
        }
        buffer_[size_] = byte;
        ++size_;
      } while (value != 0);
    }

    operator BytesIn() const {
      return BytesIn{buffer_}.first(size_);
    }

   private:
    uint8_t size_ = 0;
    // uint64_t needs at most 10 groups of 7 bits
    std::array<uint8_t, 10> buffer_{};
  };
}  // namespace swarm
