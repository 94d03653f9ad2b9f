/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include <qtils/enum_error_code.hpp>
#include <swarm/common/types.hpp>

namespace swarm {

  enum class ContextError {
    CANCELED = 1,
    DEADLINE_EXCEEDED,
  };

  Q_ENUM_ERROR_CODE(ContextError) {
    using E = decltype(e);
    switch (e) {
      case E::CANCELED:
        return "Context canceled";
      case E::DEADLINE_EXCEEDED:
        return "Context deadline exceeded";
    }
    abort();
  }

  /**
   * Cancellation and deadline scope of a request.
   *
   * Copies share cancellation state. A context derived with `withTimeout` or
   * `withCancel` is done when its parent is done, when its own deadline
   * passes, or when it is canceled itself; canceling it does not affect the
   * parent.
   * Safe to cancel from any thread.
   */
  class Context {
    struct CancelState {
      std::atomic_bool canceled{false};
      std::mutex mutex;
      size_t next_id = 0;
      std::map<size_t, std::function<void()>> callbacks;
    };

   public:
    using Clock = std::chrono::steady_clock;

    /// Unregisters its cancel callback when destroyed.
    class CancelRegistration {
     public:
      CancelRegistration() = default;
      CancelRegistration(CancelRegistration &&) noexcept = default;
      CancelRegistration &operator=(CancelRegistration &&) = delete;
      ~CancelRegistration();

     private:
      friend class Context;

      void unregister();

      std::vector<std::pair<std::weak_ptr<CancelState>, size_t>> entries_;
    };

    /// Context that is never done unless canceled.
    Context();

    Context withTimeout(Clock::duration timeout) const;

    Context withCancel() const;

    void cancel() const;

    /**
     * Call `callback` once this context or one of its ancestors is canceled,
     * immediately if it already is.
     * May be called from the thread canceling the context.
     */
    [[nodiscard]] CancelRegistration onCancel(
        std::function<void()> callback) const;

    bool done() const;

    /// Success while not done, otherwise why it is done.
    outcome::result<void> err() const;

    /// Earliest deadline of this context and its ancestors.
    std::optional<Clock::time_point> deadline() const {
      return deadline_;
    }

   private:
    std::vector<std::shared_ptr<CancelState>> canceled_;
    std::optional<Clock::time_point> deadline_;
  };

}  // namespace swarm
