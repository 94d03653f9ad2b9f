/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>

#include <swarm/common/types.hpp>

namespace swarm::crypto {
  using Hash256 = std::array<uint8_t, 32>;

  Hash256 sha256(BytesIn input);
}  // namespace swarm::crypto
