/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <climits>
#include <stdexcept>

#include <qtils/enum_error_code.hpp>
#include <swarm/common/types.hpp>

namespace swarm {

  /**
   * Errors related to protobuf encoding/decoding.
   */
  enum class ProtobufError {
    DECODE_ERROR = 1,
  };

  Q_ENUM_ERROR_CODE(ProtobufError) {
    using E = decltype(e);
    switch (e) {
      case E::DECODE_ERROR:
        return "Error decoding protobuf";
    }
    abort();
  }

  /**
   * Encode protobuf message `T`.
   * Throws `std::logic_error` if serialization fails; messages built by this
   * code base never exceed `INT_MAX`.
   */
  template <typename T>
  [[nodiscard]] Bytes protobufEncode(const T &t) {
    Bytes encoded;
    auto size = t.ByteSizeLong();
    if (size > INT_MAX) {
      throw std::logic_error{"protobufEncode: message too large"};
    }
    encoded.resize(size);
    if (not t.SerializeToArray(encoded.data(), static_cast<int>(size))) {
      throw std::logic_error{"protobufEncode: SerializeToArray failed"};
    }
    return encoded;
  }

  /**
   * Decode protobuf message `T`.
   * Returns `DECODE_ERROR` if parsing fails.
   */
  template <typename T>
  [[nodiscard]] inline outcome::result<T> protobufDecode(BytesIn encoded) {
    T t;
    if (not t.ParseFromArray(encoded.data(), static_cast<int>(encoded.size()))) {
      return ProtobufError::DECODE_ERROR;
    }
    return t;
  }
}  // namespace swarm
