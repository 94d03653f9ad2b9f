/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <swarm/common/types.hpp>
#include <swarm/coro/coro.hpp>

namespace swarm::basic {

  struct Writer {
    virtual ~Writer() = default;

    /**
     * Write a prefix of `in`.
     * @return number of bytes written, never zero on success
     */
    virtual CoroOutcome<size_t> writeSome(BytesIn in) = 0;
  };

}  // namespace swarm::basic
