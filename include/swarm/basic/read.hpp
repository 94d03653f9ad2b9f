/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <stdexcept>

#include <swarm/basic/reader.hpp>

namespace swarm {
  /**
   * Fill `out` completely.
   * Short reads are retried; the first failed `readSome` is returned.
   */
  inline CoroOutcome<void> read(std::shared_ptr<basic::Reader> reader,
                                BytesOut out) {
    while (not out.empty()) {
      BOOST_OUTCOME_CO_TRY(auto n, co_await reader->readSome(out));
      if (n == 0 or n > out.size()) {
        throw std::logic_error{"swarm::read invalid readSome result"};
      }
      out = out.subspan(n);
    }
    co_return outcome::success();
  }
}  // namespace swarm
