/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <swarm/common/address.hpp>

#include <bit>

#include <boost/algorithm/hex.hpp>
#include <boost/container_hash/hash.hpp>

namespace swarm {

  outcome::result<Address> Address::fromHex(std::string_view hex) {
    Bytes bytes;
    try {
      boost::algorithm::unhex(hex.begin(), hex.end(), std::back_inserter(bytes));
    } catch (const boost::algorithm::hex_decode_error &) {
      return AddressError::INVALID_HEX;
    }
    return Address{std::move(bytes)};
  }

  std::string Address::toHex() const {
    std::string hex;
    hex.reserve(bytes_.size() * 2);
    boost::algorithm::hex_lower(
        bytes_.begin(), bytes_.end(), std::back_inserter(hex));
    return hex;
  }

  outcome::result<int> distanceCmp(const Address &a,
                                   const Address &x,
                                   const Address &y) {
    auto ab = a.bytes();
    auto xb = x.bytes();
    auto yb = y.bytes();
    if (xb.size() != ab.size() or yb.size() != ab.size()) {
      return AddressError::LENGTH_MISMATCH;
    }
    for (size_t i = 0; i < ab.size(); ++i) {
      uint8_t dx = xb[i] ^ ab[i];
      uint8_t dy = yb[i] ^ ab[i];
      if (dx == dy) {
        continue;
      }
      return dx < dy ? 1 : -1;
    }
    return 0;
  }

  uint8_t proximity(const Address &a, const Address &b) {
    auto ab = a.bytes();
    auto bb = b.bytes();
    auto size = std::min(ab.size(), bb.size());
    size_t po = 0;
    for (size_t i = 0; i < size and po < kMaxPo; ++i) {
      uint8_t diff = ab[i] ^ bb[i];
      if (diff == 0) {
        po += 8;
        continue;
      }
      po += std::countl_zero(diff);
      break;
    }
    return static_cast<uint8_t>(std::min<size_t>(po, kMaxPo));
  }

}  // namespace swarm

size_t std::hash<swarm::Address>::operator()(
    const swarm::Address &address) const {
  auto bytes = address.bytes();
  return boost::hash_range(bytes.begin(), bytes.end());
}
