/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"
#include "primitives/address/address.hpp"
#include "primitives/types.hpp"

namespace paychan::crypto::payment {
  enum class PaymentHashError {
    kRandomUnavailable = 1,
  };

  using primitives::ChannelId;
  using primitives::Hash256;
  using primitives::Nonce;
  using primitives::TokenAmount;
  using primitives::address::Address;

  /**
   * Hash of cumulative channel state signed by sender and checked by
   * recipient and ledger:
   * keccak256(channel_id[32] || uint256(amount) || uint256(nonce)),
   * same bytes as solidity abi.encodePacked(bytes32, uint256, uint256).
   * @param channel_id - channel
   * @param amount - cumulative amount in base units
   * @param nonce - state nonce
   * @return hash, or error if amount is negative or exceeds uint256
   */
  outcome::result<Hash256> paymentHash(const ChannelId &channel_id,
                      const TokenAmount &amount,
                      Nonce nonce);

  /**
   * Channel identifier:
   * keccak256(sender[20] || recipient[20] || uint256(timestamp_ms) ||
   * uint256(salt)).
   */
  ChannelId channelIdHash(const Address &sender,
                          const Address &recipient,
                          uint64_t timestamp_ms,
                          const Hash256 &salt);

  /// 32 bytes from OpenSSL CSPRNG
  outcome::result<Hash256> randomSalt();
}  // namespace paychan::crypto::payment

OUTCOME_HPP_DECLARE_ERROR(paychan::crypto::payment, PaymentHashError);
