/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "crypto/ed25519.hpp"
#include "crypto/ed25519/ed25519_verifier.hpp"

using light::PublicKey;
using light::crypto::Ed25519Verifier;
namespace ed25519 = light::crypto::ed25519;

class Ed25519VerifierTest : public testing::Test {
 public:
  void SetUp() override {
    ed25519::Secret seed;
    seed.fill(7);
    keypair = ed25519::keypairFromSeed(seed).value();
    auto public_key = ed25519::publicKey(keypair);
    std::ranges::copy(public_key, pub_key.begin());
    signature = ed25519::sign(keypair, message).value();
  }

  Ed25519Verifier verifier;
  ed25519::KeyPair keypair;
  PublicKey pub_key;
  qtils::ByteVec message{'v', 'o', 't', 'e'};
  ed25519::Signature signature;
};

TEST_F(Ed25519VerifierTest, AcceptsValidSignature) {
  EXPECT_TRUE(verifier.verify(pub_key, message, signature));
}

TEST_F(Ed25519VerifierTest, RejectsAlteredMessage) {
  auto altered = message;
  altered.back() ^= 1;
  EXPECT_FALSE(verifier.verify(pub_key, altered, signature));
}

TEST_F(Ed25519VerifierTest, RejectsOtherKey) {
  ed25519::Secret seed;
  seed.fill(8);
  auto other = ed25519::publicKey(ed25519::keypairFromSeed(seed).value());
  PublicKey other_key;
  std::ranges::copy(other, other_key.begin());
  EXPECT_FALSE(verifier.verify(other_key, message, signature));
}

TEST_F(Ed25519VerifierTest, RejectsWrongSignatureLength) {
  qtils::ByteVec truncated(signature.begin(), signature.end() - 1);
  EXPECT_FALSE(verifier.verify(pub_key, message, truncated));
}
