/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <optional>
#include <unordered_map>

#include <swarm/storage/putter.hpp>

namespace swarm::storage {

  class InmemStore : public Putter {
   public:
    outcome::result<void> put(const Context &ctx,
                              ModePut mode,
                              const Chunk &chunk) override;

    std::optional<Chunk> get(const Address &address) const;

    bool has(const Address &address) const;

    size_t size() const;

   private:
    mutable std::mutex mutex_;
    std::unordered_map<Address, Chunk> chunks_;
  };

}  // namespace swarm::storage
