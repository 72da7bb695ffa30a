/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/signature_verifier.hpp"

namespace light::crypto {

  /// Ed25519 signatures, as produced by Tendermint validators
  class Ed25519Verifier : public SignatureVerifier {
   public:
    bool verify(const PublicKey &public_key,
                qtils::BytesIn message,
                qtils::BytesIn signature) const override;
  };

}  // namespace light::crypto
