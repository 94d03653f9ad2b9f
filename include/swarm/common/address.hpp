/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <qtils/enum_error_code.hpp>
#include <swarm/common/types.hpp>

namespace swarm {

  enum class AddressError {
    INVALID_HEX = 1,
    LENGTH_MISMATCH,
  };

  Q_ENUM_ERROR_CODE(AddressError) {
    using E = decltype(e);
    switch (e) {
      case E::INVALID_HEX:
        return "Address is not a valid hex string";
      case E::LENGTH_MISMATCH:
        return "Addresses have different lengths";
    }
    abort();
  }

  /// Deepest proximity order tracked by the overlay.
  constexpr uint8_t kMaxPo = 31;

  /**
   * Overlay address of a node or of a chunk.
   * Both live in the same keyspace, so "closest node to a chunk" is the
   * node whose address has the smallest XOR distance to the chunk address.
   */
  class Address {
   public:
    static constexpr size_t kSize = 32;

    Address() = default;

    explicit Address(Bytes bytes) : bytes_{std::move(bytes)} {}

    explicit Address(BytesIn bytes) : bytes_{bytes.begin(), bytes.end()} {}

    static outcome::result<Address> fromHex(std::string_view hex);

    BytesIn bytes() const {
      return bytes_;
    }

    bool empty() const {
      return bytes_.empty();
    }

    std::string toHex() const;

    bool operator==(const Address &) const = default;
    auto operator<=>(const Address &) const = default;

   private:
    Bytes bytes_;
  };

  /**
   * Compare XOR distances of `x` and `y` to `a`.
   * @return 1 if `x` is closer to `a` than `y`, -1 if `y` is closer, 0 if
   * equidistant
   */
  outcome::result<int> distanceCmp(const Address &a,
                                   const Address &x,
                                   const Address &y);

  /**
   * Number of leading bits shared by `a` and `b`, capped at `kMaxPo`.
   */
  uint8_t proximity(const Address &a, const Address &b);

}  // namespace swarm

template <>
struct std::hash<swarm::Address> {
  size_t operator()(const swarm::Address &address) const;
};

template <>
struct fmt::formatter<swarm::Address> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const swarm::Address &address, FormatContext &ctx) const {
    auto hex = address.toHex();
    return fmt::formatter<std::string_view>::format(hex, ctx);
  }
};
