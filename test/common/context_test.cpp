/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <thread>

#include <gtest/gtest.h>
#include <swarm/common/context.hpp>

#include "testutil/outcome.hpp"

using swarm::Context;
using swarm::ContextError;
using namespace std::chrono_literals;

TEST(ContextTest, BackgroundNeverDone) {
  Context ctx;
  EXPECT_FALSE(ctx.done());
  EXPECT_OUTCOME_SUCCESS(ctx.err());
  EXPECT_FALSE(ctx.deadline().has_value());
}

TEST(ContextTest, CancelPropagatesToChildren) {
  Context parent;
  auto child = parent.withCancel();
  auto grandchild = child.withTimeout(1h);
  parent.cancel();
  EXPECT_OUTCOME_ERROR(ContextError::CANCELED, child.err());
  EXPECT_OUTCOME_ERROR(ContextError::CANCELED, grandchild.err());
}

TEST(ContextTest, CancelDoesNotAffectParent) {
  Context parent;
  auto child = parent.withCancel();
  child.cancel();
  EXPECT_TRUE(child.done());
  EXPECT_FALSE(parent.done());
}

TEST(ContextTest, CopiesShareCancellation) {
  auto ctx = Context{}.withCancel();
  auto copy = ctx;
  ctx.cancel();
  EXPECT_TRUE(copy.done());
}

TEST(ContextTest, DeadlineExceeded) {
  auto ctx = Context{}.withTimeout(1ms);
  std::this_thread::sleep_for(5ms);
  EXPECT_OUTCOME_ERROR(ContextError::DEADLINE_EXCEEDED, ctx.err());
}

TEST(ContextTest, ChildKeepsEarlierDeadline) {
  auto parent = Context{}.withTimeout(10ms);
  auto child = parent.withTimeout(1h);
  ASSERT_TRUE(child.deadline().has_value());
  EXPECT_EQ(child.deadline(), parent.deadline());
  auto tighter = parent.withTimeout(1ms);
  EXPECT_LT(*tighter.deadline(), *parent.deadline());
}

/**
 * @given callbacks registered on a context and on its child
 * @when the parent is canceled
 * @then both run once, and a later cancel runs nothing again
 */
TEST(ContextTest, CancelRunsCallbacks) {
  Context parent;
  auto child = parent.withCancel();
  int parent_calls = 0;
  int child_calls = 0;
  auto on_parent = parent.onCancel([&] { ++parent_calls; });
  auto on_child = child.onCancel([&] { ++child_calls; });
  parent.cancel();
  EXPECT_EQ(parent_calls, 1);
  EXPECT_EQ(child_calls, 1);
  parent.cancel();
  child.cancel();
  EXPECT_EQ(parent_calls, 1);
  EXPECT_EQ(child_calls, 1);
}

TEST(ContextTest, CancelCallbackOfCanceledContextRunsImmediately) {
  auto ctx = Context{}.withCancel();
  ctx.cancel();
  int calls = 0;
  auto registration = ctx.onCancel([&] { ++calls; });
  EXPECT_EQ(calls, 1);
}

TEST(ContextTest, DestroyedRegistrationIsNotCalled) {
  auto ctx = Context{}.withCancel();
  int calls = 0;
  {
    auto registration = ctx.onCancel([&] { ++calls; });
  }
  ctx.cancel();
  EXPECT_EQ(calls, 0);
}

TEST(ContextTest, ChildCancelDoesNotCallParentCallbacks) {
  Context parent;
  auto child = parent.withCancel();
  int calls = 0;
  auto registration = parent.onCancel([&] { ++calls; });
  child.cancel();
  EXPECT_EQ(calls, 0);
}
