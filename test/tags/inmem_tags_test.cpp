/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>
#include <swarm/tags/inmem_tags.hpp>

#include "testutil/outcome.hpp"

using namespace swarm::tags;

TEST(InmemTagsTest, CreateGet) {
  InmemTags tags;
  auto first = tags.create(3);
  auto second = tags.create(0);
  EXPECT_NE(first->id(), second->id());
  EXPECT_EQ(tags.get(first->id()), first);
  EXPECT_EQ(tags.get(second->id()), second);
  EXPECT_EQ(tags.get(0), nullptr);
}

TEST(InmemTagsTest, CountersBoundedByTotal) {
  InmemTag tag{1, 2};
  EXPECT_OUTCOME_SUCCESS(tag.inc(State::SENT));
  EXPECT_OUTCOME_SUCCESS(tag.inc(State::SENT));
  EXPECT_OUTCOME_ERROR(TagError::COUNTER_OVERFLOW, tag.inc(State::SENT));
  EXPECT_EQ(tag.get(State::SENT), 2);
  // each state counts separately
  EXPECT_OUTCOME_SUCCESS(tag.inc(State::SYNCED));
  EXPECT_EQ(tag.get(State::SYNCED), 1);
  EXPECT_EQ(tag.get(State::STORED), 0);
}

TEST(InmemTagsTest, UnboundedTotal) {
  InmemTag tag{1, 0};
  for (int i = 0; i < 100; ++i) {
    EXPECT_OUTCOME_SUCCESS(tag.inc(State::SENT));
  }
  EXPECT_EQ(tag.get(State::SENT), 100);
}
