/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "channels/payment_receiver.hpp"

#include <fmt/format.h>

#include "channels/channel_error.hpp"
#include "channels/payment_accumulator.hpp"
#include "channels/x402_header.hpp"
#include "common/hexutil.hpp"
#include "common/logger.hpp"
#include "crypto/payment/payment_hash.hpp"

namespace paychan::channels {
  using common::toHex0x;

  /// Lifetime of payment request
  constexpr std::chrono::minutes kPaymentRequestTtl{5};

  inline auto &log() {
    static auto log{common::createLogger("PaymentReceiver")};
    return log;
  }

  namespace {
    /// Hex of first `size` bytes without 0x
    std::string shortHex(BytesIn bytes, size_t size) {
      return toHex0x(bytes.first(size)).substr(2);
    }
  }  // namespace

  PaymentReceiver::PaymentReceiver(std::shared_ptr<Signer> signer,
                                   std::shared_ptr<clock::UTCClock> clock,
                                   uint32_t decimals)
      : signer_{std::move(signer)},
        clock_{std::move(clock)},
        decimals_{decimals} {}

  bool PaymentReceiver::verifyPayment(const SignedPayment &payment,
                                      const Address &expected_sender) const {
    return channels::verifyPayment(*signer_, payment, expected_sender);
  }

  outcome::result<PaymentReceipt> PaymentReceiver::acknowledgePayment(
      const SignedPayment &payment) {
    if (!primitives::isUint256(payment.amount)) {
      return ChannelError::kInvalidAmount;
    }
    OUTCOME_TRY(hash,
                crypto::payment::paymentHash(
                    payment.channel_id, payment.amount, payment.nonce));
    std::lock_guard lock{mutex_};
    auto &inbox{inboxes_[payment.channel_id]};
    TokenAmount previous;
    if (inbox.latest) {
      if (payment.nonce <= inbox.latest->nonce) {
        log()->warn("payment {} of channel {} already acknowledged",
                    payment.nonce,
                    toHex0x(payment.channel_id));
        return ChannelError::kReplayedPayment;
      }
      if (payment.amount < inbox.latest->amount) {
        return ChannelError::kInvalidAmount;
      }
      previous = inbox.latest->amount;
    }
    PaymentReceipt receipt;
    receipt.receipt_id = fmt::format("rcpt_{}", shortHex(hash, 8));
    receipt.channel_id = payment.channel_id;
    receipt.amount = payment.amount - previous;
    receipt.total_spent = payment.amount;
    receipt.nonce = payment.nonce;
    receipt.timestamp = clock_->nowMillis();
    inbox.receipts.push_back(receipt);
    inbox.latest = payment;
    return receipt;
  }

  outcome::result<PaymentReceipt> PaymentReceiver::acceptPayment(
      const SignedPayment &payment, const Address &expected_sender) {
    if (!verifyPayment(payment, expected_sender)) {
      return ChannelError::kSignatureVerificationFailed;
    }
    return acknowledgePayment(payment);
  }

  outcome::result<PaymentReceipt> PaymentReceiver::acceptHeader(
      std::string_view header, const Address &expected_sender) {
    OUTCOME_TRY(decoded, decodeX402Header(header, decimals_));
    if (decoded.channel_id != decoded.payment.channel_id) {
      return ChannelError::kPaymentChannelMismatch;
    }
    return acceptPayment(decoded.payment, expected_sender);
  }

  boost::optional<SignedPayment> PaymentReceiver::latestPayment(
      const ChannelId &id) const {
    std::lock_guard lock{mutex_};
    auto it{inboxes_.find(id)};
    if (it == inboxes_.end()) {
      return boost::none;
    }
    return it->second.latest;
  }

  std::vector<PaymentReceipt> PaymentReceiver::receipts(
      const ChannelId &id) const {
    std::lock_guard lock{mutex_};
    auto it{inboxes_.find(id)};
    if (it == inboxes_.end()) {
      return {};
    }
    return it->second.receipts;
  }

  outcome::result<PaymentRequest> PaymentReceiver::createPaymentRequest(
      const ChannelId &id,
      const TokenAmount &amount,
      const std::string &description) {
    if (amount <= 0) {
      return ChannelError::kInvalidAmount;
    }
    OUTCOME_TRY(salt, crypto::payment::randomSalt());
    auto now{clock_->nowMillis()};
    PaymentRequest request;
    request.request_id =
        fmt::format("req_{}_{}", now.count(), shortHex(salt, 4));
    request.channel_id = id;
    request.amount = amount;
    request.description = description;
    request.expires_at =
        now + std::chrono::duration_cast<Timestamp>(kPaymentRequestTtl);
    return request;
  }
}  // namespace paychan::channels
