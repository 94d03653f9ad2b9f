/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <unordered_map>

#include <qtils/enum_error_code.hpp>
#include <swarm/accounting/accounting.hpp>
#include <swarm/log/logger.hpp>

namespace swarm::accounting {

  enum class AccountingError {
    OVERDRAFT = 1,
    NOT_RESERVED,
    AMOUNT_TOO_LARGE,
  };

  Q_ENUM_ERROR_CODE(AccountingError) {
    using E = decltype(e);
    switch (e) {
      case E::OVERDRAFT:
        return "Payment threshold exceeded";
      case E::NOT_RESERVED:
        return "Payment was not reserved";
      case E::AMOUNT_TOO_LARGE:
        return "Payment amount out of range";
    }
    abort();
  }

  struct InmemAccountingConfig {
    // Fixes default field values with boost::di.
    InmemAccountingConfig() = default;

    /// Maximum debt to a single peer, including reserved payments.
    Price payment_threshold = 10000;
  };

  /**
   * Ledger kept in memory.
   * Balance is positive when the peer owes us.
   */
  class InmemAccounting : public Accounting {
   public:
    explicit InmemAccounting(InmemAccountingConfig config);

    outcome::result<void> reserve(const Context &ctx,
                                  const Address &peer,
                                  Price amount) override;

    void release(const Address &peer, Price amount) override;

    outcome::result<void> credit(const Address &peer, Price amount) override;

    outcome::result<void> debit(const Address &peer, Price amount) override;

    int64_t balance(const Address &peer) const;

    Price reserved(const Address &peer) const;

   private:
    struct PeerBalance {
      int64_t balance = 0;
      Price reserved = 0;
    };

    InmemAccountingConfig config_;
    mutable std::mutex mutex_;
    std::unordered_map<Address, PeerBalance> balances_;
    log::Logger log_ = log::createLogger("Accounting", "accounting");
  };

}  // namespace swarm::accounting
