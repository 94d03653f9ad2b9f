/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio/awaitable.hpp>
#include <qtils/outcome.hpp>

namespace swarm {
  /**
   * Coroutine running on an `io_context` executor.
   *
   * A coroutine returned from a function does not start until it is
   * `co_await`-ed or handed to `coroSpawn`. Stream handlers, the push loop and
   * replication tasks are all written as `Coro`, so every suspension point is
   * a stream read, a stream write or a timer.
   */
  template <typename T>
  using Coro = boost::asio::awaitable<T>;

  /**
   * Coroutine returning outcome.
   */
  template <typename T>
  using CoroOutcome = Coro<outcome::result<T>>;
}  // namespace swarm
