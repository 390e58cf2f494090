/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "payment_channel_manager/impl/payment_channel_manager_impl.hpp"

#include "channels/statistics.hpp"
#include "channels/x402_header.hpp"

namespace paychan::payment_channel_manager {
  using channels::X402ChannelHeader;

  outcome::result<std::shared_ptr<PaymentChannelManagerImpl>>
  PaymentChannelManagerImpl::create(std::shared_ptr<ledger::Ledger> ledger,
                                    std::shared_ptr<Signer> signer,
                                    std::shared_ptr<clock::UTCClock> clock,
                                    const PrivateKey &key,
                                    const ManagerConfig &config) {
    OUTCOME_TRY(address, signer->address(key));
    return std::make_shared<PaymentChannelManagerImpl>(std::move(ledger),
                                                       std::move(signer),
                                                       std::move(clock),
                                                       key,
                                                       address,
                                                       config);
  }

  PaymentChannelManagerImpl::PaymentChannelManagerImpl(
      std::shared_ptr<ledger::Ledger> ledger,
      std::shared_ptr<Signer> signer,
      std::shared_ptr<clock::UTCClock> clock,
      const PrivateKey &key,
      const Address &address,
      const ManagerConfig &config)
      : address_{address},
        decimals_{config.decimals},
        clock_{clock},
        store_{std::make_shared<ChannelStore>()} {
    auto_topup_ =
        std::make_shared<AutoTopupEngine>(store_, ledger, config.ledger_timeout);
    accumulator_ =
        std::make_shared<PaymentAccumulator>(store_,
                                             signer,
                                             key,
                                             address_,
                                             clock,
                                             auto_topup_,
                                             config.auto_settle_threshold);
    lifecycle_ = std::make_shared<LifecycleManager>(
        store_,
        ledger,
        signer,
        clock,
        address_,
        channels::LifecycleConfig{config.default_duration,
                                  config.ledger_timeout,
                                  config.challenge_period});
    receiver_ =
        std::make_shared<PaymentReceiver>(signer, clock, config.decimals);
  }

  const Address &PaymentChannelManagerImpl::address() const {
    return address_;
  }

  outcome::result<Channel> PaymentChannelManagerImpl::createChannel(
      const CreateChannelParams &params) {
    return lifecycle_->createChannel(params);
  }

  outcome::result<SignedPayment> PaymentChannelManagerImpl::pay(
      const ChannelId &id, const TokenAmount &amount) {
    return accumulator_->pay(id, amount);
  }

  outcome::result<BatchPaymentReceipt> PaymentChannelManagerImpl::batchPay(
      const ChannelId &id, const std::vector<BatchPaymentItem> &items) {
    return accumulator_->batchPay(id, items);
  }

  outcome::result<std::string> PaymentChannelManagerImpl::createX402Header(
      const ChannelId &id, const TokenAmount &amount) {
    OUTCOME_TRY(payment, accumulator_->pay(id, amount));
    X402ChannelHeader header;
    header.channel_id = id;
    header.payment = payment;
    return channels::encodeX402Header(header, decimals_);
  }

  bool PaymentChannelManagerImpl::verifyPayment(
      const SignedPayment &payment, const Address &expected_sender) const {
    return accumulator_->verifyPayment(payment, expected_sender);
  }

  outcome::result<PaymentReceipt> PaymentChannelManagerImpl::acknowledgePayment(
      const SignedPayment &payment) {
    return receiver_->acknowledgePayment(payment);
  }

  outcome::result<PaymentReceipt> PaymentChannelManagerImpl::acceptPayment(
      const SignedPayment &payment, const Address &expected_sender) {
    return receiver_->acceptPayment(payment, expected_sender);
  }

  outcome::result<PaymentReceipt> PaymentChannelManagerImpl::acceptX402Header(
      std::string_view header, const Address &expected_sender) {
    return receiver_->acceptHeader(header, expected_sender);
  }

  boost::optional<SignedPayment> PaymentChannelManagerImpl::latestPayment(
      const ChannelId &id) const {
    return receiver_->latestPayment(id);
  }

  std::vector<PaymentReceipt> PaymentChannelManagerImpl::getReceipts(
      const ChannelId &id) const {
    return receiver_->receipts(id);
  }

  outcome::result<SettlementResult> PaymentChannelManagerImpl::closeChannel(
      const ChannelId &id) {
    return lifecycle_->closeChannel(id);
  }

  outcome::result<DisputeResult> PaymentChannelManagerImpl::disputeChannel(
      const ChannelId &id, const SignedPayment &payment) {
    return lifecycle_->disputeChannel(id, payment);
  }

  outcome::result<Channel> PaymentChannelManagerImpl::reconcileSettlement(
      const ChannelId &id) {
    return lifecycle_->reconcileSettlement(id);
  }

  outcome::result<void> PaymentChannelManagerImpl::trackChannel(
      const Channel &channel) {
    return lifecycle_->trackChannel(channel);
  }

  outcome::result<void> PaymentChannelManagerImpl::extendChannel(
      const ChannelId &id, std::chrono::seconds duration) {
    return lifecycle_->extendChannel(id, duration);
  }

  outcome::result<void> PaymentChannelManagerImpl::topUpChannel(
      const ChannelId &id, const TokenAmount &amount) {
    return lifecycle_->topUpChannel(id, amount);
  }

  outcome::result<void> PaymentChannelManagerImpl::updateAutoTopup(
      const ChannelId &id, const AutoTopupConfig &config) {
    return auto_topup_->updateAutoTopup(id, config);
  }

  outcome::result<void> PaymentChannelManagerImpl::disableAutoTopup(
      const ChannelId &id) {
    return auto_topup_->disableAutoTopup(id);
  }

  outcome::result<AutoTopupStatus>
  PaymentChannelManagerImpl::getAutoTopupStatus(const ChannelId &id) const {
    return auto_topup_->getAutoTopupStatus(id);
  }

  outcome::result<PaymentRequest>
  PaymentChannelManagerImpl::createPaymentRequest(
      const ChannelId &id,
      const TokenAmount &amount,
      const std::string &description) {
    return receiver_->createPaymentRequest(id, amount, description);
  }

  outcome::result<Channel> PaymentChannelManagerImpl::getChannel(
      const ChannelId &id) const {
    return store_->get(id);
  }

  std::vector<Channel> PaymentChannelManagerImpl::getAllChannels() const {
    return store_->list();
  }

  std::vector<Channel> PaymentChannelManagerImpl::getOpenChannels() const {
    return store_->listOpen();
  }

  std::vector<Channel> PaymentChannelManagerImpl::getChannelsWithRecipient(
      const Address &recipient) const {
    return store_->listByRecipient(recipient);
  }

  std::vector<Channel> PaymentChannelManagerImpl::getChannelsBySender(
      const Address &sender) const {
    return store_->listBySender(sender);
  }

  ChannelStats PaymentChannelManagerImpl::getStats() const {
    return channels::aggregateStats(store_->list());
  }

  outcome::result<ExtendedChannelStats>
  PaymentChannelManagerImpl::getChannelStats(const ChannelId &id) const {
    OUTCOME_TRY(record, store_->getRecord(id));
    return channels::channelStats(record, clock_->nowMillis());
  }
}  // namespace paychan::payment_channel_manager
