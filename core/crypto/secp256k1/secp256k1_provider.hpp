/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/bytes.hpp"
#include "common/outcome.hpp"
#include "crypto/secp256k1/secp256k1_types.hpp"

namespace paychan::crypto::secp256k1 {

  /**
   * ECDSA over secp256k1 with pubkey recovery.
   * Messages are already hashed 32-byte digests, provider applies no digest
   * function. Public keys are uncompressed, signatures are compact with
   * recovery id.
   */
  class Secp256k1Provider {
   public:
    virtual ~Secp256k1Provider() = default;

    /**
     * @brief Generate private and public keys
     * @return Secp256k1 key pair or error code
     */
    virtual outcome::result<KeyPair> generate() const = 0;

    /**
     * @brief Generate public key from private key
     * @param key - private key for deriving public key
     * @return Derived public key or error code
     */
    virtual outcome::result<PublicKey> derive(const PrivateKey &key) const = 0;

    /**
     * @brief Create signature for a digest
     * @param digest - 32 bytes to sign
     * @param key - private key for signing
     * @return Secp256k1 signature or error code
     */
    virtual outcome::result<Signature> sign(BytesIn digest,
                                            const PrivateKey &key) const = 0;

    /**
     * RecoverPubkey returns the the public key of the signer.
     * @param digest - signed 32 bytes
     * @param signature - target for recovery
     * @return Derived public key or error code
     */
    virtual outcome::result<PublicKey> recoverPublicKey(
        BytesIn digest, const Signature &signature) const = 0;
  };

}  // namespace paychan::crypto::secp256k1
