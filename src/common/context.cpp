/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <swarm/common/context.hpp>

namespace swarm {

  Context::CancelRegistration::~CancelRegistration() {
    unregister();
  }

  void Context::CancelRegistration::unregister() {
    for (auto &[weak_state, id] : entries_) {
      if (auto state = weak_state.lock()) {
        std::lock_guard lock{state->mutex};
        state->callbacks.erase(id);
      }
    }
    entries_.clear();
  }

  Context::Context() : canceled_{std::make_shared<CancelState>()} {}

  Context Context::withTimeout(Clock::duration timeout) const {
    auto child = withCancel();
    auto deadline = Clock::now() + timeout;
    if (not child.deadline_.has_value() or deadline < *child.deadline_) {
      child.deadline_ = deadline;
    }
    return child;
  }

  Context Context::withCancel() const {
    Context child{*this};
    child.canceled_.emplace_back(std::make_shared<CancelState>());
    return child;
  }

  void Context::cancel() const {
    auto &state = *canceled_.back();
    std::map<size_t, std::function<void()>> callbacks;
    {
      std::lock_guard lock{state.mutex};
      if (state.canceled.exchange(true)) {
        return;
      }
      callbacks.swap(state.callbacks);
    }
    for (auto &[id, callback] : callbacks) {
      callback();
    }
  }

  Context::CancelRegistration Context::onCancel(
      std::function<void()> callback) const {
    CancelRegistration registration;
    for (auto &state : canceled_) {
      std::unique_lock lock{state->mutex};
      if (state->canceled.load()) {
        lock.unlock();
        registration.unregister();
        callback();
        return registration;
      }
      auto id = state->next_id++;
      state->callbacks.emplace(id, callback);
      registration.entries_.emplace_back(state, id);
    }
    return registration;
  }

  bool Context::done() const {
    return not err().has_value();
  }

  outcome::result<void> Context::err() const {
    for (auto &state : canceled_) {
      if (state->canceled.load()) {
        return ContextError::CANCELED;
      }
    }
    if (deadline_.has_value() and Clock::now() >= *deadline_) {
      return ContextError::DEADLINE_EXCEEDED;
    }
    return outcome::success();
  }

}  // namespace swarm
