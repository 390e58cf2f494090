/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/payment/payment_hash.hpp"

#include <openssl/rand.h>

#include "crypto/keccak/keccak.hpp"

namespace paychan::crypto::payment {
  using primitives::encodeUint256;

  outcome::result<Hash256> paymentHash(const ChannelId &channel_id,
                                       const TokenAmount &amount,
                                       Nonce nonce) {
    OUTCOME_TRY(packed_amount, encodeUint256(amount));
    keccak::Ctx ctx;
    ctx.update(channel_id);
    ctx.update(packed_amount);
    ctx.update(encodeUint256(nonce));
    return ctx.final();
  }

  ChannelId channelIdHash(const Address &sender,
                          const Address &recipient,
                          uint64_t timestamp_ms,
                          const Hash256 &salt) {
    keccak::Ctx ctx;
    ctx.update(sender.bytes);
    ctx.update(recipient.bytes);
    ctx.update(encodeUint256(timestamp_ms));
    ctx.update(salt);
    return ctx.final();
  }

  outcome::result<Hash256> randomSalt() {
    Hash256 salt{};
    if (RAND_bytes(salt.data(), salt.size()) != 1) {
      return PaymentHashError::kRandomUnavailable;
    }
    return salt;
  }
}  // namespace paychan::crypto::payment

OUTCOME_CPP_DEFINE_CATEGORY(paychan::crypto::payment, PaymentHashError, e) {
  using E = paychan::crypto::payment::PaymentHashError;
  switch (e) {
    case E::kRandomUnavailable:
      return "PaymentHash: random generator failed";
  }
  return "PaymentHash: unknown error";
}
