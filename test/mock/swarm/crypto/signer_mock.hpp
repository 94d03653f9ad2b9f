/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>
#include <swarm/crypto/signer.hpp>

namespace swarm::crypto {
  class SignerMock : public Signer {
   public:
    MOCK_METHOD(outcome::result<Bytes>, sign, (BytesIn), (const, override));
  };
}  // namespace swarm::crypto
