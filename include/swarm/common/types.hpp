/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include <qtils/outcome.hpp>

namespace swarm {
  using Bytes = std::vector<uint8_t>;
  using BytesIn = std::span<const uint8_t>;
  using BytesOut = std::span<uint8_t>;

  /// Amount of accounting units paid for a receipt.
  using Price = uint64_t;
}  // namespace swarm
