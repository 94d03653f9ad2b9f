/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <swarm/accounting/accounting.hpp>

namespace swarm::accounting {

  /**
   * Scoped hold of `amount` against the balance with `peer`.
   * Resolved exactly once: `credit` turns it into a payment, otherwise it is
   * released on `release` or destruction.
   */
  class Reservation {
   public:
    static outcome::result<Reservation> reserve(
        std::shared_ptr<Accounting> accounting,
        const Context &ctx,
        const Address &peer,
        Price amount);

    Reservation(Reservation &&other) noexcept;
    Reservation &operator=(Reservation &&) = delete;
    Reservation(const Reservation &) = delete;
    Reservation &operator=(const Reservation &) = delete;

    ~Reservation();

    /**
     * Pay the reserved amount.
     * The reservation is resolved even if the ledger rejects the payment.
     */
    outcome::result<void> credit();

    void release();

    bool pending() const {
      return accounting_ != nullptr;
    }

    const Address &peer() const {
      return peer_;
    }

    Price amount() const {
      return amount_;
    }

   private:
    Reservation(std::shared_ptr<Accounting> accounting,
                Address peer,
                Price amount);

    std::shared_ptr<Accounting> accounting_;
    Address peer_;
    Price amount_;
  };

}  // namespace swarm::accounting
