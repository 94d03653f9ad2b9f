/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <swarm/accounting/reservation.hpp>

#include <stdexcept>
#include <utility>

namespace swarm::accounting {

  outcome::result<Reservation> Reservation::reserve(
      std::shared_ptr<Accounting> accounting,
      const Context &ctx,
      const Address &peer,
      Price amount) {
    OUTCOME_TRY(accounting->reserve(ctx, peer, amount));
    return Reservation{std::move(accounting), peer, amount};
  }

  Reservation::Reservation(std::shared_ptr<Accounting> accounting,
                           Address peer,
                           Price amount)
      : accounting_{std::move(accounting)},
        peer_{std::move(peer)},
        amount_{amount} {}

  Reservation::Reservation(Reservation &&other) noexcept
      : accounting_{std::exchange(other.accounting_, nullptr)},
        peer_{std::move(other.peer_)},
        amount_{other.amount_} {}

  Reservation::~Reservation() {
    release();
  }

  outcome::result<void> Reservation::credit() {
    auto accounting = std::exchange(accounting_, nullptr);
    if (accounting == nullptr) {
      throw std::logic_error{"Reservation::credit: already resolved"};
    }
    return accounting->credit(peer_, amount_);
  }

  void Reservation::release() {
    if (auto accounting = std::exchange(accounting_, nullptr)) {
      accounting->release(peer_, amount_);
    }
  }

}  // namespace swarm::accounting
