/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <secp256k1.h>

#include "crypto/secp256k1/secp256k1_provider.hpp"

namespace paychan::crypto::secp256k1 {
  /// libsecp256k1 backed provider, keys are drawn from OpenSSL RAND_bytes
  class Secp256k1ProviderImpl : public Secp256k1Provider {
   public:
    Secp256k1ProviderImpl();

    outcome::result<KeyPair> generate() const override;

    outcome::result<PublicKey> derive(const PrivateKey &key) const override;

    outcome::result<Signature> sign(BytesIn digest,
                                    const PrivateKey &key) const override;

    outcome::result<PublicKey> recoverPublicKey(
        BytesIn digest, const Signature &signature) const override;

   private:
    outcome::result<PublicKey> serialize(const secp256k1_pubkey &point) const;

    std::unique_ptr<secp256k1_context, void (*)(secp256k1_context *)> context_;

    static outcome::result<void> checkDigest(BytesIn digest);
    static outcome::result<void> checkSignature(const Signature &signature);
  };
}  // namespace paychan::crypto::secp256k1
