/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <limits>

#include <gtest/gtest.h>
#include <swarm/accounting/inmem_accounting.hpp>

#include "testutil/addresses.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace swarm;
using accounting::AccountingError;
using accounting::InmemAccounting;

class InmemAccountingTest : public ::testing::Test {
 public:
  static void SetUpTestSuite() {
    testutil::prepareLoggers();
  }

  static accounting::InmemAccountingConfig makeConfig() {
    accounting::InmemAccountingConfig config;
    config.payment_threshold = 100;
    return config;
  }

  InmemAccounting accounting{makeConfig()};
  Context ctx;
  Address peer = testutil::makeAddress(0x10);
};

TEST_F(InmemAccountingTest, ReserveCredit) {
  EXPECT_OUTCOME_SUCCESS(accounting.reserve(ctx, peer, 40));
  EXPECT_EQ(accounting.reserved(peer), 40);
  EXPECT_OUTCOME_SUCCESS(accounting.credit(peer, 40));
  EXPECT_EQ(accounting.reserved(peer), 0);
  EXPECT_EQ(accounting.balance(peer), -40);
}

TEST_F(InmemAccountingTest, ReserveRelease) {
  EXPECT_OUTCOME_SUCCESS(accounting.reserve(ctx, peer, 40));
  accounting.release(peer, 40);
  EXPECT_EQ(accounting.reserved(peer), 0);
  EXPECT_EQ(accounting.balance(peer), 0);
}

/**
 * @given debt and pending reservations towards a peer
 * @when reserving beyond the payment threshold
 * @then the reservation is refused
 */
TEST_F(InmemAccountingTest, Overdraft) {
  EXPECT_OUTCOME_SUCCESS(accounting.reserve(ctx, peer, 50));
  EXPECT_OUTCOME_SUCCESS(accounting.credit(peer, 50));
  EXPECT_OUTCOME_SUCCESS(accounting.reserve(ctx, peer, 30));
  EXPECT_OUTCOME_ERROR(AccountingError::OVERDRAFT,
                       accounting.reserve(ctx, peer, 21));
  EXPECT_OUTCOME_SUCCESS(accounting.reserve(ctx, peer, 20));
  // other peers have their own threshold
  EXPECT_OUTCOME_SUCCESS(
      accounting.reserve(ctx, testutil::makeAddress(0x11), 100));
}

/**
 * @given pending reservation towards a peer
 * @when reserving an amount that wraps around when added to it
 * @then the reservation is refused and nothing can be paid
 */
TEST_F(InmemAccountingTest, HugeAmountOverdraft) {
  constexpr auto kHuge = std::numeric_limits<Price>::max();
  EXPECT_OUTCOME_SUCCESS(accounting.reserve(ctx, peer, 1));
  EXPECT_OUTCOME_ERROR(AccountingError::OVERDRAFT,
                       accounting.reserve(ctx, peer, kHuge));
  EXPECT_EQ(accounting.reserved(peer), 1);
  EXPECT_OUTCOME_ERROR(AccountingError::AMOUNT_TOO_LARGE,
                       accounting.credit(peer, kHuge));
  EXPECT_OUTCOME_ERROR(AccountingError::AMOUNT_TOO_LARGE,
                       accounting.debit(peer, kHuge));
  EXPECT_EQ(accounting.balance(peer), 0);
}

TEST_F(InmemAccountingTest, DebitRepaysDebt) {
  EXPECT_OUTCOME_SUCCESS(accounting.reserve(ctx, peer, 100));
  EXPECT_OUTCOME_SUCCESS(accounting.credit(peer, 100));
  EXPECT_OUTCOME_ERROR(AccountingError::OVERDRAFT,
                       accounting.reserve(ctx, peer, 1));
  EXPECT_OUTCOME_SUCCESS(accounting.debit(peer, 60));
  EXPECT_EQ(accounting.balance(peer), -40);
  EXPECT_OUTCOME_SUCCESS(accounting.reserve(ctx, peer, 60));
}

TEST_F(InmemAccountingTest, CreditWithoutReservation) {
  EXPECT_OUTCOME_ERROR(AccountingError::NOT_RESERVED,
                       accounting.credit(peer, 1));
  EXPECT_EQ(accounting.balance(peer), 0);
}

TEST_F(InmemAccountingTest, ReserveCanceled) {
  auto canceled = ctx.withCancel();
  canceled.cancel();
  EXPECT_OUTCOME_ERROR(ContextError::CANCELED,
                       accounting.reserve(canceled, peer, 1));
  EXPECT_EQ(accounting.reserved(peer), 0);
}
