/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "crypto/secp256k1/secp256k1_provider.hpp"
#include "crypto/signer/signer.hpp"

namespace paychan::crypto::signer {
  /**
   * Ethereum personal message signatures (EIP-191 version 0x45).
   * Signs keccak256("\x19Ethereum Signed Message:\n32" || hash), addresses
   * are the last 20 bytes of keccak256 of the uncompressed public key.
   */
  class EthSigner : public Signer {
   public:
    explicit EthSigner(
        std::shared_ptr<secp256k1::Secp256k1Provider> secp256k1_provider);

    outcome::result<Signature> sign(const Hash256 &message_hash,
                                    const PrivateKey &key) const override;

    outcome::result<Address> recover(const Hash256 &message_hash,
                                     const Signature &signature) const override;

    outcome::result<Address> address(const PrivateKey &key) const override;

    /// Hash that is actually passed to ECDSA
    static Hash256 personalMessageHash(const Hash256 &message_hash);

    static Address addressFromPublicKey(const secp256k1::PublicKey &key);

   private:
    std::shared_ptr<secp256k1::Secp256k1Provider> secp256k1_provider_;
  };
}  // namespace paychan::crypto::signer
