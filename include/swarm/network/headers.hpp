/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <string>

#include <swarm/common/types.hpp>

namespace swarm {
  /// Named binary headers exchanged once when a stream is opened.
  using Headers = std::map<std::string, Bytes>;
}  // namespace swarm
