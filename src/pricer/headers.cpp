/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <swarm/pricer/headers.hpp>

#include <boost/endian/conversion.hpp>

namespace swarm::pricer {
  namespace {
    Bytes encodeU64(uint64_t value) {
      Bytes bytes(sizeof(value));
      boost::endian::store_big_u64(bytes.data(), value);
      return bytes;
    }

    outcome::result<uint64_t> decodeU64(const Headers &headers,
                                        std::string_view name,
                                        HeaderError missing) {
      auto it = headers.find(std::string{name});
      if (it == headers.end()) {
        return missing;
      }
      if (it->second.size() != sizeof(uint64_t)) {
        return HeaderError::FIELD_LENGTH;
      }
      return boost::endian::load_big_u64(it->second.data());
    }

    outcome::result<Address> decodeTarget(const Headers &headers) {
      auto it = headers.find(std::string{kTargetHeader});
      if (it == headers.end()) {
        return HeaderError::NO_TARGET_HEADER;
      }
      return Address{it->second};
    }
  }  // namespace

  Headers makePricingHeaders(Price price, const Address &target) {
    return {
        {std::string{kPriceHeader}, encodeU64(price)},
        {std::string{kTargetHeader}, Bytes{target.bytes().begin(), target.bytes().end()}},
    };
  }

  Headers makePricingResponseHeaders(Price price,
                                     const Address &target,
                                     uint64_t index) {
    auto headers = makePricingHeaders(price, target);
    headers.emplace(std::string{kIndexHeader}, encodeU64(index));
    return headers;
  }

  outcome::result<PricingHeaders> parsePricingHeaders(const Headers &headers) {
    OUTCOME_TRY(target, decodeTarget(headers));
    OUTCOME_TRY(price, parsePriceHeader(headers));
    return PricingHeaders{std::move(target), price};
  }

  outcome::result<PricingResponseHeaders> parsePricingResponseHeaders(
      const Headers &headers) {
    OUTCOME_TRY(parsed, parsePricingHeaders(headers));
    OUTCOME_TRY(index,
                decodeU64(headers, kIndexHeader, HeaderError::NO_INDEX_HEADER));
    return PricingResponseHeaders{std::move(parsed.target), parsed.price, index};
  }

  outcome::result<Price> parsePriceHeader(const Headers &headers) {
    return decodeU64(headers, kPriceHeader, HeaderError::NO_PRICE_HEADER);
  }

}  // namespace swarm::pricer
