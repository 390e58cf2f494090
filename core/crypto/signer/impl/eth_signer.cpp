/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/signer/impl/eth_signer.hpp"

#include <string_view>

#include "crypto/keccak/keccak.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(paychan::crypto::signer, SignerError, e) {
  using E = paychan::crypto::signer::SignerError;
  switch (e) {
    case E::kInvalidSignature:
      return "SignerError: invalid signature recovery byte";
  }
  return "SignerError: unknown error";
}

namespace paychan::crypto::signer {
  using keccak::keccak256;

  constexpr uint8_t kRecoveryIdOffset = 27;
  constexpr std::string_view kPersonalMessagePrefix{
      "\x19"
      "Ethereum Signed Message:\n32"};

  EthSigner::EthSigner(
      std::shared_ptr<secp256k1::Secp256k1Provider> secp256k1_provider)
      : secp256k1_provider_{std::move(secp256k1_provider)} {}

  outcome::result<Signature> EthSigner::sign(const Hash256 &message_hash,
                                             const PrivateKey &key) const {
    OUTCOME_TRY(signature,
                secp256k1_provider_->sign(personalMessageHash(message_hash),
                                          key));
    signature[64] += kRecoveryIdOffset;
    return signature;
  }

  outcome::result<Address> EthSigner::recover(
      const Hash256 &message_hash, const Signature &signature) const {
    if (signature[64] < kRecoveryIdOffset
        || signature[64] > kRecoveryIdOffset + 3) {
      return SignerError::kInvalidSignature;
    }
    auto compact{signature};
    compact[64] -= kRecoveryIdOffset;
    OUTCOME_TRY(public_key,
                secp256k1_provider_->recoverPublicKey(
                    personalMessageHash(message_hash), compact));
    return addressFromPublicKey(public_key);
  }

  outcome::result<Address> EthSigner::address(const PrivateKey &key) const {
    OUTCOME_TRY(public_key, secp256k1_provider_->derive(key));
    return addressFromPublicKey(public_key);
  }

  Hash256 EthSigner::personalMessageHash(const Hash256 &message_hash) {
    Bytes data(kPersonalMessagePrefix.begin(), kPersonalMessagePrefix.end());
    append(data, message_hash);
    return keccak256(data);
  }

  Address EthSigner::addressFromPublicKey(const secp256k1::PublicKey &key) {
    // skip 0x04 uncompressed marker
    const auto hash{keccak256(gsl::make_span(key).subspan(1))};
    Address address;
    std::copy(hash.end() - address.bytes.size(), hash.end(),
              address.bytes.begin());
    return address;
  }
}  // namespace paychan::crypto::signer
