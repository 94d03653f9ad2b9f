/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>
#include <swarm/pricer/headers.hpp>

#include "testutil/addresses.hpp"
#include "testutil/outcome.hpp"

using namespace swarm::pricer;
using testutil::makeAddress;

TEST(PricingHeadersTest, Request) {
  auto target = makeAddress(0x42, 7);
  auto headers = makePricingHeaders(150, target);
  // prices travel as big-endian u64
  EXPECT_EQ(headers.at(std::string{kPriceHeader}),
            (swarm::Bytes{0, 0, 0, 0, 0, 0, 0, 150}));
  ASSERT_OUTCOME_SUCCESS(parsed, parsePricingHeaders(headers));
  EXPECT_EQ(parsed.target, target);
  EXPECT_EQ(parsed.price, 150);
  EXPECT_OUTCOME_ERROR(HeaderError::NO_INDEX_HEADER,
                       parsePricingResponseHeaders(headers));
}

TEST(PricingHeadersTest, Response) {
  auto target = makeAddress(0x01);
  auto headers = makePricingResponseHeaders(0x0102030405060708, target, 12);
  ASSERT_OUTCOME_SUCCESS(parsed, parsePricingResponseHeaders(headers));
  EXPECT_EQ(parsed.target, target);
  EXPECT_EQ(parsed.price, 0x0102030405060708);
  EXPECT_EQ(parsed.index, 12);
}

TEST(PricingHeadersTest, Missing) {
  swarm::Headers headers;
  EXPECT_OUTCOME_ERROR(HeaderError::NO_PRICE_HEADER, parsePriceHeader(headers));
  EXPECT_OUTCOME_ERROR(HeaderError::NO_TARGET_HEADER,
                       parsePricingHeaders(headers));
  headers.emplace(std::string{kTargetHeader}, swarm::Bytes(32, 1));
  EXPECT_OUTCOME_ERROR(HeaderError::NO_PRICE_HEADER,
                       parsePricingHeaders(headers));
}

TEST(PricingHeadersTest, WrongLength) {
  swarm::Headers headers{
      {std::string{kPriceHeader}, swarm::Bytes{1, 2, 3}},
  };
  EXPECT_OUTCOME_ERROR(HeaderError::FIELD_LENGTH, parsePriceHeader(headers));
}
