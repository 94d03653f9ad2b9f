/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <swarm/basic/encode_varint.hpp>
#include <swarm/basic/write.hpp>

namespace swarm {

  /**
   * Write `message` prefixed with its varint-encoded length.
   */
  inline CoroOutcome<void> writeVarintMessage(
      std::shared_ptr<basic::Writer> writer, BytesIn message) {
    BOOST_OUTCOME_CO_TRY(co_await write(writer, EncodeVarint{message.size()}));
    BOOST_OUTCOME_CO_TRY(co_await write(writer, message));
    co_return outcome::success();
  }
}  // namespace swarm
