/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <optional>

#include <schnorrkel.h>

#include <qtils/byte_arr.hpp>
#include <qtils/bytes.hpp>

namespace light::crypto::ed25519 {
  using Secret = qtils::ByteArr<ED25519_SECRET_KEY_LENGTH>;
  using Public = qtils::ByteArr<ED25519_PUBLIC_KEY_LENGTH>;
  using KeyPair = qtils::ByteArr<ED25519_KEYPAIR_LENGTH>;
  using Signature = qtils::ByteArr<ED25519_SIGNATURE_LENGTH>;
  using Message = qtils::BytesIn;

  inline std::optional<KeyPair> keypairFromSeed(const Secret &seed) {
    KeyPair keypair;
    auto res = ed25519_keypair_from_seed(keypair.data(), seed.data());
    if (res != ED25519_RESULT_OK) {
      return std::nullopt;
    }
    return keypair;
  }

  /// Keypair layout is `secret || public`
  inline Public publicKey(const KeyPair &keypair) {
    Public public_key;
    std::copy_n(keypair.begin() + ED25519_SECRET_KEY_LENGTH,
                ED25519_PUBLIC_KEY_LENGTH,
                public_key.begin());
    return public_key;
  }

  inline std::optional<Signature> sign(const KeyPair &keypair,
                                       Message message) {
    Signature sig;
    auto res = ed25519_sign(
        sig.data(), keypair.data(), message.data(), message.size_bytes());
    if (res != ED25519_RESULT_OK) {
      return std::nullopt;
    }
    return sig;
  }

  inline bool verify(const Signature &signature,
                     Message message,
                     const Public &public_key) {
    auto res = ed25519_verify(signature.data(),
                              public_key.data(),
                              message.data(),
                              message.size_bytes());
    return res == ED25519_RESULT_OK;
  }
}  // namespace light::crypto::ed25519
