/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <swarm/common/types.hpp>
#include <swarm/coro/coro.hpp>

namespace swarm::basic {

  struct Reader {
    virtual ~Reader() = default;

    /**
     * Read at least one byte into `out`, suspending until data arrives.
     * @return number of bytes read, never zero on success
     */
    virtual CoroOutcome<size_t> readSome(BytesOut out) = 0;
  };

}  // namespace swarm::basic
