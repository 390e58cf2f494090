/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

#include "channels/channel.hpp"
#include "clock/utc_clock.hpp"
#include "crypto/signer/signer.hpp"

namespace paychan::channels {
  using crypto::signer::Signer;

  /**
   * Recipient side of channels.
   * Keeps own view of acknowledged payments and never touches sender state.
   */
  class PaymentReceiver {
   public:
    PaymentReceiver(std::shared_ptr<Signer> signer,
                    std::shared_ptr<clock::UTCClock> clock,
                    uint32_t decimals);

    bool verifyPayment(const SignedPayment &payment,
                       const Address &expected_sender) const;

    /**
     * Stores receipt for payment newer than every acknowledged one.
     * Signature is not checked here, see acceptPayment.
     * @return kReplayedPayment for nonce not above highest acknowledged,
     * kInvalidAmount for cumulative amount below acknowledged one
     */
    outcome::result<PaymentReceipt> acknowledgePayment(
        const SignedPayment &payment);

    /// verifyPayment then acknowledgePayment
    outcome::result<PaymentReceipt> acceptPayment(
        const SignedPayment &payment, const Address &expected_sender);

    /// Decodes x402 header value and accepts its payment
    outcome::result<PaymentReceipt> acceptHeader(
        std::string_view header, const Address &expected_sender);

    /// Highest acknowledged payment, the one to dispute with
    boost::optional<SignedPayment> latestPayment(const ChannelId &id) const;

    std::vector<PaymentReceipt> receipts(const ChannelId &id) const;

    /**
     * Merchant request for payment, valid for 5 minutes
     */
    outcome::result<PaymentRequest> createPaymentRequest(
        const ChannelId &id,
        const TokenAmount &amount,
        const std::string &description);

   private:
    struct Inbox {
      std::vector<PaymentReceipt> receipts;
      boost::optional<SignedPayment> latest;
    };

    std::shared_ptr<Signer> signer_;
    std::shared_ptr<clock::UTCClock> clock_;
    uint32_t decimals_;

    mutable std::mutex mutex_;
    std::map<ChannelId, Inbox> inboxes_;
  };
}  // namespace paychan::channels
