/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "channels/auto_topup_engine.hpp"
#include "channels/channel_store.hpp"
#include "clock/utc_clock.hpp"
#include "crypto/signer/signer.hpp"

namespace paychan::channels {
  using crypto::signer::Signer;
  using crypto::secp256k1::PrivateKey;

  /**
   * Checks signature of payment
   * @param payment - payment to verify, hash is recomputed from its fields
   * @param expected_sender - channel sender
   * @return true if payment was signed by expected_sender
   */
  bool verifyPayment(const Signer &signer,
                     const SignedPayment &payment,
                     const Address &expected_sender);

  /**
   * Sender side producer of cumulative signed states.
   * New state is computed, signed and stored while channel is locked, so
   * two payments are never signed against the same prior state.
   * Only channels whose sender is `self` are paid from.
   */
  class PaymentAccumulator {
   public:
    PaymentAccumulator(std::shared_ptr<ChannelStore> store,
                       std::shared_ptr<Signer> signer,
                       const PrivateKey &key,
                       const Address &self,
                       std::shared_ptr<clock::UTCClock> clock,
                       std::shared_ptr<AutoTopupEngine> auto_topup,
                       boost::optional<TokenAmount> auto_settle_threshold);

    /**
     * Authorizes `amount` more to recipient
     * @param id - open channel
     * @param amount - increment, positive
     * @return state signed for (spent + amount, nonce + 1)
     */
    outcome::result<SignedPayment> pay(const ChannelId &id,
                                       const TokenAmount &amount);

    /**
     * Authorizes several payments with one signature.
     * Items get nonces nonce + 1 ... nonce + N, only final cumulative
     * state is signed. Either all items are applied or none.
     */
    outcome::result<BatchPaymentReceipt> batchPay(
        const ChannelId &id, const std::vector<BatchPaymentItem> &items);

    bool verifyPayment(const SignedPayment &payment,
                       const Address &expected_sender) const;

   private:
    outcome::result<void> checkPayable(const Channel &channel,
                                       Timestamp now) const;

    /// Auto top-up and settle hint, never fails payment
    void afterPayment(const ChannelId &id, const TokenAmount &balance);

    std::shared_ptr<ChannelStore> store_;
    std::shared_ptr<Signer> signer_;
    PrivateKey key_;
    Address self_;
    std::shared_ptr<clock::UTCClock> clock_;
    std::shared_ptr<AutoTopupEngine> auto_topup_;
    boost::optional<TokenAmount> auto_settle_threshold_;
  };
}  // namespace paychan::channels
