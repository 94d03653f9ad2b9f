/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <atomic>
#include <mutex>
#include <unordered_map>

#include <qtils/enum_error_code.hpp>
#include <swarm/tags/tags.hpp>

namespace swarm::tags {

  enum class TagError {
    COUNTER_OVERFLOW = 1,
  };

  Q_ENUM_ERROR_CODE(TagError) {
    using E = decltype(e);
    switch (e) {
      case E::COUNTER_OVERFLOW:
        return "Tag counter exceeds total";
    }
    abort();
  }

  /**
   * Tag with atomic counters.
   * A counter may not exceed `total` unless `total` is zero.
   */
  class InmemTag : public Tag {
   public:
    InmemTag(TagId id, uint64_t total);

    outcome::result<void> inc(State state) override;

    uint64_t get(State state) const;

    TagId id() const {
      return id_;
    }

    uint64_t total() const {
      return total_;
    }

   private:
    static constexpr size_t kStates = static_cast<size_t>(State::SYNCED) + 1;

    TagId id_;
    uint64_t total_;
    std::array<std::atomic<uint64_t>, kStates> counters_{};
  };

  class InmemTags : public Tags {
   public:
    /// New tag expecting `total` chunks.
    std::shared_ptr<InmemTag> create(uint64_t total);

    std::shared_ptr<Tag> get(TagId id) const override;

   private:
    mutable std::mutex mutex_;
    TagId next_id_ = 1;
    std::unordered_map<TagId, std::shared_ptr<InmemTag>> tags_;
  };

}  // namespace swarm::tags
