/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <swarm/storage/inmem_store.hpp>

namespace swarm::storage {

  outcome::result<void> InmemStore::put(const Context &ctx,
                                        ModePut,
                                        const Chunk &chunk) {
    OUTCOME_TRY(ctx.err());
    std::lock_guard lock{mutex_};
    chunks_.emplace(chunk.address, chunk);
    return outcome::success();
  }

  std::optional<Chunk> InmemStore::get(const Address &address) const {
    std::lock_guard lock{mutex_};
    auto it = chunks_.find(address);
    if (it == chunks_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  bool InmemStore::has(const Address &address) const {
    std::lock_guard lock{mutex_};
    return chunks_.contains(address);
  }

  size_t InmemStore::size() const {
    std::lock_guard lock{mutex_};
    return chunks_.size();
  }

}  // namespace swarm::storage
