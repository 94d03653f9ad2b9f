/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio/co_spawn.hpp>
#include <swarm/coro/coro.hpp>

namespace swarm {
  template <typename T>
  concept CoroSpawnExecutor =
      boost::asio::is_executor<T>::value
      || boost::asio::execution::is_executor<T>::value
      || std::is_convertible_v<T, boost::asio::execution_context &>;

  /**
   * Start detached coroutine.
   * Nobody awaits it, so the result (if any) is dropped and exceptions are
   * rethrown from the executor.
   */
  void coroSpawn(CoroSpawnExecutor auto &&executor, Coro<void> &&coro) {
    boost::asio::co_spawn(std::forward<decltype(executor)>(executor),
                          std::move(coro),
                          [](std::exception_ptr e) {
                            if (e != nullptr) {
                              std::rethrow_exception(e);
                            }
                          });
  }

  template <typename T>
  void coroSpawn(CoroSpawnExecutor auto &&executor, Coro<T> &&coro) {
    coroSpawn(std::forward<decltype(executor)>(executor),
              [](Coro<T> coro) -> Coro<void> {
                std::ignore = co_await std::move(coro);
              }(std::move(coro)));
  }

  /**
   * Start detached coroutine created by `f`.
   * `f` is moved into coroutine state, so lambda captures outlive the caller:
   * `co_spawn([capture] { ... })` would leave them dangling.
   */
  void coroSpawn(CoroSpawnExecutor auto &&executor, auto &&f) {
    coroSpawn(std::forward<decltype(executor)>(executor),
              [](std::remove_cvref_t<decltype(f)> f) -> Coro<void> {
                if constexpr (std::is_void_v<decltype(f().await_resume())>) {
                  co_await f();
                } else {
                  std::ignore = co_await f();
                }
              }(std::forward<decltype(f)>(f)));
  }
}  // namespace swarm
