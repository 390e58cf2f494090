/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "channels/auto_topup_engine.hpp"
#include "channels/channel_store.hpp"
#include "channels/lifecycle_manager.hpp"
#include "channels/payment_accumulator.hpp"
#include "channels/payment_receiver.hpp"
#include "clock/utc_clock.hpp"
#include "config/manager_config.hpp"
#include "ledger/ledger.hpp"
#include "payment_channel_manager/payment_channel_manager.hpp"

namespace paychan::payment_channel_manager {
  using channels::AutoTopupEngine;
  using channels::ChannelStore;
  using channels::LifecycleManager;
  using channels::PaymentAccumulator;
  using channels::PaymentReceiver;
  using config::ManagerConfig;
  using crypto::secp256k1::PrivateKey;
  using crypto::signer::Signer;

  class PaymentChannelManagerImpl : public PaymentChannelManager {
   public:
    /**
     * @param key - sender key, channels are opened from its address
     */
    static outcome::result<std::shared_ptr<PaymentChannelManagerImpl>> create(
        std::shared_ptr<ledger::Ledger> ledger,
        std::shared_ptr<Signer> signer,
        std::shared_ptr<clock::UTCClock> clock,
        const PrivateKey &key,
        const ManagerConfig &config);

    PaymentChannelManagerImpl(std::shared_ptr<ledger::Ledger> ledger,
                              std::shared_ptr<Signer> signer,
                              std::shared_ptr<clock::UTCClock> clock,
                              const PrivateKey &key,
                              const Address &address,
                              const ManagerConfig &config);

    const Address &address() const override;

    outcome::result<Channel> createChannel(
        const CreateChannelParams &params) override;

    outcome::result<SignedPayment> pay(const ChannelId &id,
                                       const TokenAmount &amount) override;

    outcome::result<BatchPaymentReceipt> batchPay(
        const ChannelId &id,
        const std::vector<BatchPaymentItem> &items) override;

    outcome::result<std::string> createX402Header(
        const ChannelId &id, const TokenAmount &amount) override;

    bool verifyPayment(const SignedPayment &payment,
                       const Address &expected_sender) const override;

    outcome::result<PaymentReceipt> acknowledgePayment(
        const SignedPayment &payment) override;

    outcome::result<PaymentReceipt> acceptPayment(
        const SignedPayment &payment, const Address &expected_sender) override;

    outcome::result<PaymentReceipt> acceptX402Header(
        std::string_view header, const Address &expected_sender) override;

    boost::optional<SignedPayment> latestPayment(
        const ChannelId &id) const override;

    std::vector<PaymentReceipt> getReceipts(
        const ChannelId &id) const override;

    outcome::result<SettlementResult> closeChannel(
        const ChannelId &id) override;

    outcome::result<DisputeResult> disputeChannel(
        const ChannelId &id, const SignedPayment &payment) override;

    outcome::result<Channel> reconcileSettlement(const ChannelId &id) override;

    outcome::result<void> trackChannel(const Channel &channel) override;

    outcome::result<void> extendChannel(const ChannelId &id,
                                        std::chrono::seconds duration) override;

    outcome::result<void> topUpChannel(const ChannelId &id,
                                       const TokenAmount &amount) override;

    outcome::result<void> updateAutoTopup(
        const ChannelId &id, const AutoTopupConfig &config) override;

    outcome::result<void> disableAutoTopup(const ChannelId &id) override;

    outcome::result<AutoTopupStatus> getAutoTopupStatus(
        const ChannelId &id) const override;

    outcome::result<PaymentRequest> createPaymentRequest(
        const ChannelId &id,
        const TokenAmount &amount,
        const std::string &description) override;

    outcome::result<Channel> getChannel(const ChannelId &id) const override;

    std::vector<Channel> getAllChannels() const override;

    std::vector<Channel> getOpenChannels() const override;

    std::vector<Channel> getChannelsWithRecipient(
        const Address &recipient) const override;

    std::vector<Channel> getChannelsBySender(
        const Address &sender) const override;

    ChannelStats getStats() const override;

    outcome::result<ExtendedChannelStats> getChannelStats(
        const ChannelId &id) const override;

   private:
    Address address_;
    uint32_t decimals_;
    std::shared_ptr<clock::UTCClock> clock_;
    std::shared_ptr<ChannelStore> store_;
    std::shared_ptr<AutoTopupEngine> auto_topup_;
    std::shared_ptr<PaymentAccumulator> accumulator_;
    std::shared_ptr<LifecycleManager> lifecycle_;
    std::shared_ptr<PaymentReceiver> receiver_;
  };
}  // namespace paychan::payment_channel_manager
