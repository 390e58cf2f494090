/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"
#include "crypto/secp256k1/secp256k1_types.hpp"
#include "primitives/address/address.hpp"
#include "primitives/types.hpp"

namespace paychan::crypto::signer {
  using primitives::Hash256;
  using primitives::address::Address;
  using secp256k1::PrivateKey;

  constexpr size_t kSignatureLength = 65;

  /// r || s || v, with v = 27 + recovery id
  using Signature = BytesN<kSignatureLength>;

  enum class SignerError {
    kInvalidSignature = 1,
  };

  /**
   * Signing and signer recovery over 32-byte message hashes.
   * Whatever prefixing the scheme applies is internal to the implementation,
   * so `recover(h, sign(h, k)) == address(k)` for any hash h and key k.
   */
  class Signer {
   public:
    virtual ~Signer() = default;

    /**
     * Signs message hash
     * @param message_hash - hash of signed state
     * @param key - signer private key
     * @return 65-byte signature
     */
    virtual outcome::result<Signature> sign(const Hash256 &message_hash,
                                            const PrivateKey &key) const = 0;

    /**
     * Recovers address of the key that produced signature
     * @param message_hash - hash of signed state
     * @param signature - signature to recover from
     * @return signer address
     */
    virtual outcome::result<Address> recover(
        const Hash256 &message_hash, const Signature &signature) const = 0;

    /**
     * Address controlled by private key
     */
    virtual outcome::result<Address> address(const PrivateKey &key) const = 0;
  };
}  // namespace paychan::crypto::signer

OUTCOME_HPP_DECLARE_ERROR(paychan::crypto::signer, SignerError);
