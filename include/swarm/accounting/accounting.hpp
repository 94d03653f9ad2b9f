/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <swarm/common/address.hpp>
#include <swarm/common/context.hpp>

namespace swarm::accounting {

  /**
   * Balance ledger with peers.
   * `credit` pays a peer for a receipt, `debit` charges a peer for one.
   * Payments to a peer are reserved before the request is sent, each
   * reservation is resolved either with `release` or with `credit`.
   * Implementations must be safe for concurrent use.
   */
  class Accounting {
   public:
    virtual ~Accounting() = default;

    /// Hold `amount` against the balance with `peer`.
    virtual outcome::result<void> reserve(const Context &ctx,
                                          const Address &peer,
                                          Price amount) = 0;

    /// Drop a hold made with `reserve`.
    virtual void release(const Address &peer, Price amount) = 0;

    /// Settle a hold made with `reserve` as a payment to `peer`.
    virtual outcome::result<void> credit(const Address &peer,
                                         Price amount) = 0;

    /// Charge `peer` for a service we provided.
    virtual outcome::result<void> debit(const Address &peer, Price amount) = 0;
  };

}  // namespace swarm::accounting
