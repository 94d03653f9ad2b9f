/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>
#include <swarm/common/address.hpp>
#include <swarm/network/headers.hpp>

namespace swarm::pricer {

  constexpr std::string_view kPriceHeader = "price";
  constexpr std::string_view kTargetHeader = "target";
  constexpr std::string_view kIndexHeader = "index";

  enum class HeaderError {
    NO_PRICE_HEADER = 1,
    NO_TARGET_HEADER,
    NO_INDEX_HEADER,
    FIELD_LENGTH,
  };

  Q_ENUM_ERROR_CODE(HeaderError) {
    using E = decltype(e);
    switch (e) {
      case E::NO_PRICE_HEADER:
        return "No price header";
      case E::NO_TARGET_HEADER:
        return "No target header";
      case E::NO_INDEX_HEADER:
        return "No index header";
      case E::FIELD_LENGTH:
        return "Header value has wrong length";
    }
    abort();
  }

  struct PricingHeaders {
    Address target;
    Price price = 0;
  };

  struct PricingResponseHeaders {
    Address target;
    Price price = 0;
    uint64_t index = 0;
  };

  /// Headers proposing `price` for a receipt of `target`.
  Headers makePricingHeaders(Price price, const Address &target);

  /// Headers accepting a stream at `price` for `target`, `index` identifies
  /// the price table row used by the acceptor.
  Headers makePricingResponseHeaders(Price price,
                                     const Address &target,
                                     uint64_t index);

  outcome::result<PricingHeaders> parsePricingHeaders(const Headers &headers);

  outcome::result<PricingResponseHeaders> parsePricingResponseHeaders(
      const Headers &headers);

  outcome::result<Price> parsePriceHeader(const Headers &headers);

}  // namespace swarm::pricer
