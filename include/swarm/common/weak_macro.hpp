/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

/**
 * Capture `weak_from_this()` into detached callbacks and coroutines, so a
 * task that outlives its owner does not keep it alive:
 *
 *    coroSpawn(io, [WEAK_SELF]() -> Coro<void> {
 *      CO_WEAK_LOCK(self);
 *      ...
 *    });
 *
 * Requires the enclosing type to inherit std::enable_shared_from_this<T>.
 */
#define WEAK_SELF          \
  weak_self {              \
    this->weak_from_this() \
  }

#define CO_WEAK_LOCK(name)        \
  auto name = weak_##name.lock(); \
  if (not name) co_return;
