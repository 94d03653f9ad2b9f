/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <swarm/accounting/inmem_accounting.hpp>

#include <limits>

namespace swarm::accounting {
  namespace {
    constexpr Price kMaxAmount = std::numeric_limits<int64_t>::max();
  }  // namespace

  InmemAccounting::InmemAccounting(InmemAccountingConfig config)
      : config_{config} {}

  outcome::result<void> InmemAccounting::reserve(const Context &ctx,
                                                 const Address &peer,
                                                 Price amount) {
    OUTCOME_TRY(ctx.err());
    std::lock_guard lock{mutex_};
    auto &entry = balances_[peer];
    auto debt = entry.balance < 0 ? static_cast<Price>(-entry.balance) : 0;
    auto used = debt + entry.reserved;
    if (amount > kMaxAmount or used > config_.payment_threshold
        or amount > config_.payment_threshold - used) {
      SL_DEBUG(log_,
               "reserve {} for peer {} exceeds threshold, debt {} reserved {}",
               amount,
               peer,
               debt,
               entry.reserved);
      return AccountingError::OVERDRAFT;
    }
    entry.reserved += amount;
    return outcome::success();
  }

  void InmemAccounting::release(const Address &peer, Price amount) {
    std::lock_guard lock{mutex_};
    auto &entry = balances_[peer];
    if (entry.reserved < amount) {
      SL_ERROR(log_,
               "release {} for peer {} exceeds reserved {}",
               amount,
               peer,
               entry.reserved);
      entry.reserved = 0;
      return;
    }
    entry.reserved -= amount;
  }

  outcome::result<void> InmemAccounting::credit(const Address &peer,
                                                Price amount) {
    std::lock_guard lock{mutex_};
    if (amount > kMaxAmount) {
      return AccountingError::AMOUNT_TOO_LARGE;
    }
    auto &entry = balances_[peer];
    if (entry.reserved < amount) {
      return AccountingError::NOT_RESERVED;
    }
    entry.reserved -= amount;
    entry.balance -= static_cast<int64_t>(amount);
    SL_TRACE(log_, "credit {} to peer {}, balance {}", amount, peer, entry.balance);
    return outcome::success();
  }

  outcome::result<void> InmemAccounting::debit(const Address &peer,
                                               Price amount) {
    if (amount > kMaxAmount) {
      return AccountingError::AMOUNT_TOO_LARGE;
    }
    std::lock_guard lock{mutex_};
    auto &entry = balances_[peer];
    entry.balance += static_cast<int64_t>(amount);
    SL_TRACE(log_, "debit {} from peer {}, balance {}", amount, peer, entry.balance);
    return outcome::success();
  }

  int64_t InmemAccounting::balance(const Address &peer) const {
    std::lock_guard lock{mutex_};
    auto it = balances_.find(peer);
    return it == balances_.end() ? 0 : it->second.balance;
  }

  Price InmemAccounting::reserved(const Address &peer) const {
    std::lock_guard lock{mutex_};
    auto it = balances_.find(peer);
    return it == balances_.end() ? 0 : it->second.reserved;
  }

}  // namespace swarm::accounting
