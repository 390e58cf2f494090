/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/secp256k1/impl/secp256k1_provider_impl.hpp"

#include <openssl/rand.h>
#include <secp256k1_recovery.h>

#include "crypto/secp256k1/secp256k1_error.hpp"

namespace paychan::crypto::secp256k1 {
  /// Attempts to draw a valid secret key before giving up
  constexpr int kGenerateAttempts = 16;

  Secp256k1ProviderImpl::Secp256k1ProviderImpl()
      : context_(secp256k1_context_create(SECP256K1_CONTEXT_SIGN
                                          | SECP256K1_CONTEXT_VERIFY),
                 secp256k1_context_destroy) {}

  outcome::result<KeyPair> Secp256k1ProviderImpl::generate() const {
    PrivateKey private_key{};
    for (auto attempt{0}; attempt < kGenerateAttempts; ++attempt) {
      if (RAND_bytes(private_key.data(), private_key.size()) != 1) {
        return Secp256k1Error::kKeyGenerationFailed;
      }
      if (secp256k1_ec_seckey_verify(context_.get(), private_key.data())) {
        OUTCOME_TRY(public_key, derive(private_key));
        return KeyPair{private_key, public_key};
      }
    }
    return Secp256k1Error::kKeyGenerationFailed;
  }

  outcome::result<PublicKey> Secp256k1ProviderImpl::derive(
      const PrivateKey &key) const {
    secp256k1_pubkey point;
    if (secp256k1_ec_pubkey_create(context_.get(), &point, key.data()) == 0) {
      return Secp256k1Error::kKeyGenerationFailed;
    }
    return serialize(point);
  }

  outcome::result<Signature> Secp256k1ProviderImpl::sign(
      BytesIn digest, const PrivateKey &key) const {
    OUTCOME_TRY(checkDigest(digest));
    secp256k1_ecdsa_recoverable_signature sig_struct;
    if (secp256k1_ecdsa_sign_recoverable(context_.get(),
                                         &sig_struct,
                                         digest.data(),
                                         key.data(),
                                         secp256k1_nonce_function_rfc6979,
                                         nullptr)
        == 0) {
      return Secp256k1Error::kCannotSignError;
    }
    Signature signature{};
    int recid{0};
    if (secp256k1_ecdsa_recoverable_signature_serialize_compact(
            context_.get(), signature.data(), &recid, &sig_struct)
        == 0) {
      return Secp256k1Error::kSignatureSerializationError;
    }
    signature[kSignatureLength - 1] = static_cast<uint8_t>(recid);
    return signature;
  }

  outcome::result<PublicKey> Secp256k1ProviderImpl::recoverPublicKey(
      BytesIn digest, const Signature &signature) const {
    OUTCOME_TRY(checkDigest(digest));
    OUTCOME_TRY(checkSignature(signature));

    secp256k1_ecdsa_recoverable_signature parsed;
    if (secp256k1_ecdsa_recoverable_signature_parse_compact(
            context_.get(),
            &parsed,
            signature.data(),
            static_cast<int>(signature[kSignatureLength - 1]))
        == 0) {
      return Secp256k1Error::kSignatureParseError;
    }
    secp256k1_pubkey point;
    if (secp256k1_ecdsa_recover(context_.get(), &point, &parsed, digest.data())
        == 0) {
      return Secp256k1Error::kRecoverError;
    }
    return serialize(point);
  }

  outcome::result<PublicKey> Secp256k1ProviderImpl::serialize(
      const secp256k1_pubkey &point) const {
    PublicKey public_key{};
    auto size{public_key.size()};
    if (secp256k1_ec_pubkey_serialize(context_.get(),
                                      public_key.data(),
                                      &size,
                                      &point,
                                      SECP256K1_EC_UNCOMPRESSED)
        == 0) {
      return Secp256k1Error::kPubkeySerializationError;
    }
    return public_key;
  }

  outcome::result<void> Secp256k1ProviderImpl::checkDigest(BytesIn digest) {
    if (static_cast<size_t>(digest.size()) != kMessageHashLength) {
      return Secp256k1Error::kMessageHashLengthError;
    }
    return outcome::success();
  }

  outcome::result<void> Secp256k1ProviderImpl::checkSignature(
      const Signature &signature) {
    // recovery id is 0..3
    if (signature[kSignatureLength - 1] > 3) {
      return Secp256k1Error::kSignatureParseError;
    }
    return outcome::success();
  }
}  // namespace paychan::crypto::secp256k1
