/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <stdexcept>

#include <swarm/basic/writer.hpp>

namespace swarm {
  /**
   * Write all of `in`.
   */
  inline CoroOutcome<void> write(std::shared_ptr<basic::Writer> writer,
                                 BytesIn in) {
    while (not in.empty()) {
      BOOST_OUTCOME_CO_TRY(auto n, co_await writer->writeSome(in));
      if (n == 0 or n > in.size()) {
        throw std::logic_error{"swarm::write invalid writeSome result"};
      }
      in = in.subspan(n);
    }
    co_return outcome::success();
  }
}  // namespace swarm
