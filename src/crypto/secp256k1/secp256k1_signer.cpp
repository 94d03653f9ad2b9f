/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <swarm/crypto/secp256k1/secp256k1_signer.hpp>

namespace swarm::crypto::secp256k1 {

  Secp256k1Signer::Context Secp256k1Signer::makeContext() {
    return {
        secp256k1_context_create(SECP256K1_CONTEXT_SIGN
                                 | SECP256K1_CONTEXT_VERIFY),
        secp256k1_context_destroy,
    };
  }

  outcome::result<std::shared_ptr<Secp256k1Signer>> Secp256k1Signer::create(
      const PrivateKey &private_key) {
    auto ctx = makeContext();
    if (secp256k1_ec_seckey_verify(ctx.get(), private_key.data()) == 0) {
      return SignerError::INVALID_PRIVATE_KEY;
    }
    secp256k1_pubkey ffi_pub;
    if (secp256k1_ec_pubkey_create(ctx.get(), &ffi_pub, private_key.data())
        == 0) {
      return SignerError::INVALID_PRIVATE_KEY;
    }
    PublicKey public_key{};
    size_t size = public_key.size();
    if (secp256k1_ec_pubkey_serialize(ctx.get(),
                                      public_key.data(),
                                      &size,
                                      &ffi_pub,
                                      SECP256K1_EC_COMPRESSED)
        == 0) {
      return SignerError::INVALID_PRIVATE_KEY;
    }
    return std::make_shared<Secp256k1Signer>(
        Private{}, std::move(ctx), private_key, public_key);
  }

  Secp256k1Signer::Secp256k1Signer(Private,
                                   Context ctx,
                                   const PrivateKey &private_key,
                                   const PublicKey &public_key)
      : ctx_{std::move(ctx)},
        private_key_{private_key},
        public_key_{public_key} {}

  outcome::result<Bytes> Secp256k1Signer::sign(BytesIn data) const {
    auto prehashed = sha256(data);
    secp256k1_ecdsa_signature ffi_sig;
    if (secp256k1_ecdsa_sign(ctx_.get(),
                             &ffi_sig,
                             prehashed.data(),
                             private_key_.data(),
                             secp256k1_nonce_function_rfc6979,
                             nullptr)
        == 0) {
      return SignerError::SIGNATURE_GENERATION_FAILED;
    }
    Bytes signature(SignatureCompact{}.size());
    secp256k1_ecdsa_signature_serialize_compact(
        ctx_.get(), signature.data(), &ffi_sig);
    return signature;
  }

  outcome::result<bool> Secp256k1Signer::verify(BytesIn data,
                                                BytesIn signature,
                                                const PublicKey &public_key) {
    auto ctx = makeContext();
    if (signature.size() != SignatureCompact{}.size()) {
      return SignerError::INVALID_SIGNATURE;
    }
    secp256k1_ecdsa_signature ffi_sig;
    if (secp256k1_ecdsa_signature_parse_compact(
            ctx.get(), &ffi_sig, signature.data())
        == 0) {
      return SignerError::INVALID_SIGNATURE;
    }
    secp256k1_pubkey ffi_pub;
    if (secp256k1_ec_pubkey_parse(
            ctx.get(), &ffi_pub, public_key.data(), public_key.size())
        == 0) {
      return SignerError::INVALID_PUBLIC_KEY;
    }
    auto prehashed = sha256(data);
    return secp256k1_ecdsa_verify(
               ctx.get(), &ffi_sig, prehashed.data(), &ffi_pub)
        == 1;
  }

}  // namespace swarm::crypto::secp256k1
