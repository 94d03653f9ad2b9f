/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <secp256k1.h>
#include <memory>

#include <qtils/enum_error_code.hpp>
#include <swarm/crypto/sha256.hpp>
#include <swarm/crypto/signer.hpp>

namespace swarm::crypto::secp256k1 {

  enum class SignerError {
    INVALID_PRIVATE_KEY = 1,
    INVALID_PUBLIC_KEY,
    INVALID_SIGNATURE,
    SIGNATURE_GENERATION_FAILED,
  };

  Q_ENUM_ERROR_CODE(SignerError) {
    using E = decltype(e);
    switch (e) {
      case E::INVALID_PRIVATE_KEY:
        return "Invalid secp256k1 private key";
      case E::INVALID_PUBLIC_KEY:
        return "Invalid secp256k1 public key";
      case E::INVALID_SIGNATURE:
        return "Invalid secp256k1 signature";
      case E::SIGNATURE_GENERATION_FAILED:
        return "Failed to generate secp256k1 signature";
    }
    abort();
  }

  using PrivateKey = std::array<uint8_t, 32>;
  /// Compressed form.
  using PublicKey = std::array<uint8_t, 33>;
  using SignatureCompact = std::array<uint8_t, 64>;

  /**
   * ECDSA secp256k1 over SHA-256 of the data, compact signatures.
   */
  class Secp256k1Signer : public Signer {
   public:
    static outcome::result<std::shared_ptr<Secp256k1Signer>> create(
        const PrivateKey &private_key);

    outcome::result<Bytes> sign(BytesIn data) const override;

    const PublicKey &publicKey() const {
      return public_key_;
    }

    static outcome::result<bool> verify(BytesIn data,
                                        BytesIn signature,
                                        const PublicKey &public_key);

   private:
    using Context =
        std::unique_ptr<secp256k1_context, void (*)(secp256k1_context *)>;

    /// Restricts construction to `create`.
    struct Private {
      explicit Private() = default;
    };

   public:
    Secp256k1Signer(Private,
                    Context ctx,
                    const PrivateKey &private_key,
                    const PublicKey &public_key);

   private:
    static Context makeContext();

    Context ctx_;
    PrivateKey private_key_;
    PublicKey public_key_;
  };

}  // namespace swarm::crypto::secp256k1
