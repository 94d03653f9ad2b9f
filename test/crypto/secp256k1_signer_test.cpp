/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>
#include <qtils/bytestr.hpp>
#include <swarm/common/sample_node.hpp>
#include <swarm/crypto/secp256k1/secp256k1_signer.hpp>

#include "testutil/outcome.hpp"

using namespace swarm;
using namespace swarm::crypto::secp256k1;

Bytes bytesOf(std::string_view str) {
  auto bytes = qtils::str2byte(str);
  return {bytes.begin(), bytes.end()};
}

class Secp256k1SignerTest : public ::testing::Test {
 public:
  SampleNode node{0};
  SampleNode other{1};
  Bytes message = bytesOf("chunk address");
};

TEST_F(Secp256k1SignerTest, SignVerify) {
  ASSERT_OUTCOME_SUCCESS(signature, node.signer->sign(message));
  EXPECT_EQ(signature.size(), SignatureCompact{}.size());
  ASSERT_OUTCOME_SUCCESS(
      valid, Secp256k1Signer::verify(message, signature, node.signer->publicKey()));
  EXPECT_TRUE(valid);
}

TEST_F(Secp256k1SignerTest, DeterministicSignature) {
  ASSERT_OUTCOME_SUCCESS(first, node.signer->sign(message));
  ASSERT_OUTCOME_SUCCESS(second, node.signer->sign(message));
  EXPECT_EQ(first, second);
}

TEST_F(Secp256k1SignerTest, WrongKeyOrData) {
  ASSERT_OUTCOME_SUCCESS(signature, node.signer->sign(message));
  ASSERT_OUTCOME_SUCCESS(
      wrong_key,
      Secp256k1Signer::verify(message, signature, other.signer->publicKey()));
  EXPECT_FALSE(wrong_key);
  ASSERT_OUTCOME_SUCCESS(wrong_data,
                         Secp256k1Signer::verify(bytesOf("other"),
                                                 signature,
                                                 node.signer->publicKey()));
  EXPECT_FALSE(wrong_data);
}

TEST_F(Secp256k1SignerTest, MalformedInput) {
  EXPECT_OUTCOME_ERROR(
      SignerError::INVALID_SIGNATURE,
      Secp256k1Signer::verify(message, Bytes(10), node.signer->publicKey()));
  ASSERT_OUTCOME_SUCCESS(signature, node.signer->sign(message));
  EXPECT_OUTCOME_ERROR(
      SignerError::INVALID_PUBLIC_KEY,
      Secp256k1Signer::verify(message, signature, PublicKey{}));
  EXPECT_OUTCOME_ERROR(SignerError::INVALID_PRIVATE_KEY,
                       Secp256k1Signer::create(PrivateKey{}));
}

TEST_F(Secp256k1SignerTest, CreateFromPrivateKey) {
  PrivateKey key{};
  key.back() = 1;
  ASSERT_OUTCOME_SUCCESS(signer, Secp256k1Signer::create(key));
  // generator point, even y
  EXPECT_EQ(signer->publicKey()[0], 0x02);
  ASSERT_OUTCOME_SUCCESS(signature, signer->sign(message));
  ASSERT_OUTCOME_SUCCESS(
      valid, Secp256k1Signer::verify(message, signature, signer->publicKey()));
  EXPECT_TRUE(valid);
}

TEST_F(Secp256k1SignerTest, SampleNodesAreDistinct) {
  EXPECT_NE(node.address, other.address);
  EXPECT_EQ(node.address, SampleNode{0}.address);
  EXPECT_EQ(node.address.bytes().size(), Address::kSize);
}
