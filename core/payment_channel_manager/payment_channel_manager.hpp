/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include "channels/channel.hpp"

namespace paychan::payment_channel_manager {
  using channels::AutoTopupConfig;
  using channels::AutoTopupStatus;
  using channels::BatchPaymentItem;
  using channels::BatchPaymentReceipt;
  using channels::Channel;
  using channels::ChannelId;
  using channels::ChannelStats;
  using channels::CreateChannelParams;
  using channels::DisputeResult;
  using channels::ExtendedChannelStats;
  using channels::PaymentReceipt;
  using channels::PaymentRequest;
  using channels::SettlementResult;
  using channels::SignedPayment;
  using primitives::TokenAmount;
  using primitives::address::Address;

  /**
   * PaymentChannelManager opens pre-funded channels from own address, signs
   * cumulative payments through them, settles or disputes them on ledger.
   * Also acts as recipient: verifies and acknowledges payments of channels
   * opened by counterparties.
   */
  class PaymentChannelManager {
   public:
    virtual ~PaymentChannelManager() = default;

    /// Address payments are signed by
    virtual const Address &address() const = 0;

    virtual outcome::result<Channel> createChannel(
        const CreateChannelParams &params) = 0;

    /**
     * Pays `amount` more through channel
     * @return new cumulative signed state
     */
    virtual outcome::result<SignedPayment> pay(const ChannelId &id,
                                               const TokenAmount &amount) = 0;

    virtual outcome::result<BatchPaymentReceipt> batchPay(
        const ChannelId &id, const std::vector<BatchPaymentItem> &items) = 0;

    /**
     * Pays and encodes payment as x402 header value
     * @return "channel <base64 json>"
     */
    virtual outcome::result<std::string> createX402Header(
        const ChannelId &id, const TokenAmount &amount) = 0;

    virtual bool verifyPayment(const SignedPayment &payment,
                               const Address &expected_sender) const = 0;

    virtual outcome::result<PaymentReceipt> acknowledgePayment(
        const SignedPayment &payment) = 0;

    /// Verifies signature and acknowledges payment
    virtual outcome::result<PaymentReceipt> acceptPayment(
        const SignedPayment &payment, const Address &expected_sender) = 0;

    virtual outcome::result<PaymentReceipt> acceptX402Header(
        std::string_view header, const Address &expected_sender) = 0;

    /// Highest acknowledged payment of channel
    virtual boost::optional<SignedPayment> latestPayment(
        const ChannelId &id) const = 0;

    virtual std::vector<PaymentReceipt> getReceipts(
        const ChannelId &id) const = 0;

    virtual outcome::result<SettlementResult> closeChannel(
        const ChannelId &id) = 0;

    virtual outcome::result<DisputeResult> disputeChannel(
        const ChannelId &id, const SignedPayment &payment) = 0;

    virtual outcome::result<Channel> reconcileSettlement(
        const ChannelId &id) = 0;

    /// Remembers channel opened by counterparty to this address
    virtual outcome::result<void> trackChannel(const Channel &channel) = 0;

    virtual outcome::result<void> extendChannel(
        const ChannelId &id, std::chrono::seconds duration) = 0;

    virtual outcome::result<void> topUpChannel(const ChannelId &id,
                                               const TokenAmount &amount) = 0;

    virtual outcome::result<void> updateAutoTopup(
        const ChannelId &id, const AutoTopupConfig &config) = 0;

    virtual outcome::result<void> disableAutoTopup(const ChannelId &id) = 0;

    virtual outcome::result<AutoTopupStatus> getAutoTopupStatus(
        const ChannelId &id) const = 0;

    virtual outcome::result<PaymentRequest> createPaymentRequest(
        const ChannelId &id,
        const TokenAmount &amount,
        const std::string &description) = 0;

    virtual outcome::result<Channel> getChannel(const ChannelId &id) const = 0;

    virtual std::vector<Channel> getAllChannels() const = 0;

    virtual std::vector<Channel> getOpenChannels() const = 0;

    virtual std::vector<Channel> getChannelsWithRecipient(
        const Address &recipient) const = 0;

    virtual std::vector<Channel> getChannelsBySender(
        const Address &sender) const = 0;

    virtual ChannelStats getStats() const = 0;

    virtual outcome::result<ExtendedChannelStats> getChannelStats(
        const ChannelId &id) const = 0;
  };
}  // namespace paychan::payment_channel_manager
