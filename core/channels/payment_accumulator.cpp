/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "channels/payment_accumulator.hpp"

#include <limits>

#include "common/hexutil.hpp"
#include "common/logger.hpp"
#include "crypto/payment/payment_hash.hpp"
#include "primitives/units.hpp"

namespace paychan::channels {
  using crypto::payment::paymentHash;
  using primitives::formatUnits;

  inline auto &log() {
    static auto log{common::createLogger("PaymentAccumulator")};
    return log;
  }

  bool verifyPayment(const Signer &signer,
                     const SignedPayment &payment,
                     const Address &expected_sender) {
    auto hash{paymentHash(payment.channel_id, payment.amount, payment.nonce)};
    if (!hash) {
      return false;
    }
    auto signer_address{signer.recover(hash.value(), payment.signature)};
    if (!signer_address) {
      return false;
    }
    return signer_address.value() == expected_sender;
  }

  PaymentAccumulator::PaymentAccumulator(
      std::shared_ptr<ChannelStore> store,
      std::shared_ptr<Signer> signer,
      const PrivateKey &key,
      const Address &self,
      std::shared_ptr<clock::UTCClock> clock,
      std::shared_ptr<AutoTopupEngine> auto_topup,
      boost::optional<TokenAmount> auto_settle_threshold)
      : store_{std::move(store)},
        signer_{std::move(signer)},
        key_{key},
        self_{self},
        clock_{std::move(clock)},
        auto_topup_{std::move(auto_topup)},
        auto_settle_threshold_{std::move(auto_settle_threshold)} {}

  outcome::result<SignedPayment> PaymentAccumulator::pay(
      const ChannelId &id, const TokenAmount &amount) {
    if (amount <= 0) {
      return ChannelError::kInvalidAmount;
    }
    TokenAmount balance;
    auto sign{[&](ChannelRecord &record) -> outcome::result<SignedPayment> {
      auto &channel{record.channel};
      auto now{clock_->nowMillis()};
      OUTCOME_TRY(checkPayable(channel, now));
      TokenAmount spent{channel.spent + amount};
      if (spent > channel.deposit) {
        return ChannelError::kInsufficientChannelBalance;
      }
      if (channel.nonce == std::numeric_limits<Nonce>::max()) {
        return ChannelError::kNonceOverflow;
      }
      Nonce nonce{channel.nonce + 1};
      OUTCOME_TRY(hash, paymentHash(id, spent, nonce));
      OUTCOME_TRY(signature, signer_->sign(hash, key_));

      channel.spent = spent;
      channel.balance = channel.deposit - spent;
      channel.nonce = nonce;
      channel.last_signature = signature;
      record.history.push_back({amount, now});
      balance = channel.balance;
      return SignedPayment{id, spent, nonce, signature, now};
    }};
    OUTCOME_TRY(payment, store_->update(id, sign));
    afterPayment(id, balance);
    return payment;
  }

  outcome::result<BatchPaymentReceipt> PaymentAccumulator::batchPay(
      const ChannelId &id, const std::vector<BatchPaymentItem> &items) {
    TokenAmount balance;
    auto sign{[&](ChannelRecord &record)
                  -> outcome::result<BatchPaymentReceipt> {
      auto &channel{record.channel};
      auto now{clock_->nowMillis()};
      OUTCOME_TRY(checkPayable(channel, now));
      if (items.empty()) {
        return ChannelError::kEmptyBatch;
      }
      TokenAmount total;
      for (const auto &item : items) {
        if (item.amount <= 0) {
          return ChannelError::kInvalidAmount;
        }
        total += item.amount;
      }
      TokenAmount spent{channel.spent + total};
      if (spent > channel.deposit) {
        return ChannelError::kInsufficientChannelBalance;
      }
      if (items.size() > std::numeric_limits<Nonce>::max() - channel.nonce) {
        return ChannelError::kNonceOverflow;
      }
      Nonce final_nonce{channel.nonce + items.size()};
      OUTCOME_TRY(hash, paymentHash(id, spent, final_nonce));
      OUTCOME_TRY(signature, signer_->sign(hash, key_));

      BatchPaymentReceipt receipt;
      receipt.signature = signature;
      receipt.payments.reserve(items.size());
      auto nonce{channel.nonce};
      for (const auto &item : items) {
        receipt.payments.push_back({item.amount, item.memo, ++nonce});
        record.history.push_back({item.amount, now});
      }
      receipt.total_amount = total;
      receipt.count = items.size();
      receipt.timestamp = now;
      receipt.payment = {id, spent, final_nonce, signature, now};

      channel.spent = spent;
      channel.balance = channel.deposit - spent;
      channel.nonce = final_nonce;
      channel.last_signature = signature;
      balance = channel.balance;
      return receipt;
    }};
    OUTCOME_TRY(receipt, store_->update(id, sign));
    afterPayment(id, balance);
    return receipt;
  }

  bool PaymentAccumulator::verifyPayment(const SignedPayment &payment,
                                         const Address &expected_sender) const {
    return channels::verifyPayment(*signer_, payment, expected_sender);
  }

  outcome::result<void> PaymentAccumulator::checkPayable(
      const Channel &channel, Timestamp now) const {
    // recipient side copy of channel
    if (channel.sender != self_) {
      return ChannelError::kInvalidState;
    }
    if (channel.state != ChannelState::kOpen) {
      return ChannelError::kInvalidState;
    }
    if (now > channel.expires_at) {
      return ChannelError::kChannelExpired;
    }
    return outcome::success();
  }

  void PaymentAccumulator::afterPayment(const ChannelId &id,
                                        const TokenAmount &balance) {
    if (auto_topup_) {
      auto_topup_->check(id);
    }
    if (auto_settle_threshold_ && balance <= *auto_settle_threshold_) {
      log()->info("auto-settle threshold reached for channel {}, balance {}",
                  common::toHex0x(id),
                  formatUnits(balance));
    }
  }
}  // namespace paychan::channels
