/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <swarm/tags/inmem_tags.hpp>

namespace swarm::tags {

  InmemTag::InmemTag(TagId id, uint64_t total) : id_{id}, total_{total} {}

  outcome::result<void> InmemTag::inc(State state) {
    auto &counter = counters_.at(static_cast<size_t>(state));
    auto value = counter.load();
    do {
      if (total_ != 0 and value >= total_) {
        return TagError::COUNTER_OVERFLOW;
      }
    } while (not counter.compare_exchange_weak(value, value + 1));
    return outcome::success();
  }

  uint64_t InmemTag::get(State state) const {
    return counters_.at(static_cast<size_t>(state)).load();
  }

  std::shared_ptr<InmemTag> InmemTags::create(uint64_t total) {
    std::lock_guard lock{mutex_};
    auto tag = std::make_shared<InmemTag>(next_id_++, total);
    tags_.emplace(tag->id(), tag);
    return tag;
  }

  std::shared_ptr<Tag> InmemTags::get(TagId id) const {
    std::lock_guard lock{mutex_};
    auto it = tags_.find(id);
    if (it == tags_.end()) {
      return nullptr;
    }
    return it->second;
  }

}  // namespace swarm::tags
