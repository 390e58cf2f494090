/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "channels/lifecycle_manager.hpp"

#include "channels/payment_accumulator.hpp"
#include "common/hexutil.hpp"
#include "common/logger.hpp"
#include "crypto/payment/payment_hash.hpp"
#include "ledger/call_blocking.hpp"
#include "primitives/units.hpp"

namespace paychan::channels {
  using common::toHex0x;
  using ledger::LedgerError;
  using primitives::formatUnits;

  inline auto &log() {
    static auto log{common::createLogger("Lifecycle")};
    return log;
  }

  LifecycleManager::LifecycleManager(std::shared_ptr<ChannelStore> store,
                                     std::shared_ptr<ledger::Ledger> ledger,
                                     std::shared_ptr<Signer> signer,
                                     std::shared_ptr<clock::UTCClock> clock,
                                     const Address &self,
                                     LifecycleConfig config)
      : store_{std::move(store)},
        ledger_{std::move(ledger)},
        signer_{std::move(signer)},
        clock_{std::move(clock)},
        self_{self},
        config_{config} {}

  outcome::result<Channel> LifecycleManager::createChannel(
      const CreateChannelParams &params) {
    if (params.deposit <= 0
        || (params.auto_topup && params.auto_topup->amount <= 0)) {
      return ChannelError::kInvalidAmount;
    }
    OUTCOME_TRY(proposed_id, makeChannelId(params.recipient));
    auto receipt{call(ledger::OpenChannel{
        proposed_id, self_, params.recipient, params.deposit})};
    if (!receipt) {
      log()->error("open channel to {} failed: {}",
                   params.recipient.toString(),
                   receipt.error().message());
      return ChannelError::kLedgerCallFailed;
    }

    auto now{clock_->nowMillis()};
    Channel channel;
    channel.id = receipt.value().channel_id.value_or(proposed_id);
    channel.sender = self_;
    channel.recipient = params.recipient;
    channel.deposit = params.deposit;
    channel.spent = 0;
    channel.balance = params.deposit;
    channel.state = ChannelState::kOpen;
    channel.created_at = now;
    channel.expires_at =
        now
        + std::chrono::duration_cast<Timestamp>(
            params.duration.value_or(config_.default_duration));

    ChannelRecord record;
    record.channel = channel;
    record.auto_topup = params.auto_topup;
    OUTCOME_TRY(store_->insert(std::move(record)));

    log()->info("channel {} opened to {} with deposit {}",
                toHex0x(channel.id),
                channel.recipient.toString(),
                formatUnits(channel.deposit));
    return channel;
  }

  outcome::result<SettlementResult> LifecycleManager::closeChannel(
      const ChannelId &id) {
    ledger::CloseChannel close;
    TokenAmount refund;
    auto begin{[&](ChannelRecord &record) -> outcome::result<void> {
      auto &channel{record.channel};
      if (channel.sender != self_) {
        return ChannelError::kInvalidState;
      }
      switch (channel.state) {
        case ChannelState::kClosed:
          return ChannelError::kAlreadyClosed;
        case ChannelState::kClosing:
        case ChannelState::kDisputed:
          return ChannelError::kInvalidState;
        case ChannelState::kPending:
        case ChannelState::kOpen:
          break;
      }
      channel.state = ChannelState::kClosing;
      close = {id, channel.spent, channel.nonce, channel.last_signature};
      refund = channel.balance;
      return outcome::success();
    }};
    OUTCOME_TRY(store_->update(id, begin));

    auto receipt{call(close)};
    if (!receipt) {
      log()->error("settlement of channel {} failed: {}",
                   toHex0x(id),
                   receipt.error().message());
      boost::optional<ChannelState> state;
      if (receipt.error() != LedgerError::kTimeout) {
        state = ChannelState::kClosed;
      }
      OUTCOME_TRY(markUnresolved(id, close, ChannelState::kClosing, state));
      return ChannelError::kSettlementUnresolved;
    }

    auto settled_at{clock_->nowMillis()};
    OUTCOME_TRY(
        store_->update(id, [&](ChannelRecord &record) -> outcome::result<void> {
          // dispute raised meanwhile takes precedence
          if (record.channel.state != ChannelState::kClosing) {
            return ChannelError::kInvalidState;
          }
          record.channel.state = ChannelState::kClosed;
          record.onchain_nonce = close.nonce;
          return outcome::success();
        }));
    log()->info("channel {} closed, recipient {} refund {}",
                toHex0x(id),
                formatUnits(close.amount),
                formatUnits(refund));
    return SettlementResult{
        id, receipt.value().tx_hash, close.amount, refund, settled_at};
  }

  outcome::result<DisputeResult> LifecycleManager::disputeChannel(
      const ChannelId &id, const SignedPayment &payment) {
    if (payment.channel_id != id) {
      return ChannelError::kPaymentChannelMismatch;
    }
    ChannelState prior{ChannelState::kOpen};
    auto begin{[&](ChannelRecord &record) -> outcome::result<void> {
      auto &channel{record.channel};
      if (channel.state == ChannelState::kClosed) {
        return ChannelError::kAlreadyClosed;
      }
      if (channel.state != ChannelState::kOpen
          && channel.state != ChannelState::kClosing) {
        return ChannelError::kInvalidState;
      }
      if (payment.nonce <= record.onchain_nonce) {
        return ChannelError::kStaleNonce;
      }
      if (payment.amount > channel.deposit) {
        return ChannelError::kInsufficientChannelBalance;
      }
      if (!verifyPayment(*signer_, payment, channel.sender)) {
        return ChannelError::kSignatureVerificationFailed;
      }
      prior = channel.state;
      channel.state = ChannelState::kDisputed;
      return outcome::success();
    }};
    OUTCOME_TRY(store_->update(id, begin));

    ledger::DisputeChannel dispute{
        id, payment.amount, payment.nonce, payment.signature};
    auto receipt{call(dispute)};
    if (!receipt) {
      log()->error("dispute of channel {} failed: {}",
                   toHex0x(id),
                   receipt.error().message());
      if (receipt.error() == LedgerError::kTimeout) {
        OUTCOME_TRY(markUnresolved(
            id, dispute, ChannelState::kDisputed, boost::none));
        return ChannelError::kSettlementUnresolved;
      }
      OUTCOME_TRY(store_->update(
          id, [&](ChannelRecord &record) -> outcome::result<void> {
            if (record.channel.state == ChannelState::kDisputed) {
              record.channel.state = prior;
            }
            return outcome::success();
          }));
      return ChannelError::kLedgerCallFailed;
    }

    auto deadline{receipt.value().challenge_deadline.value_or(
        clock_->nowMillis()
        + std::chrono::duration_cast<Timestamp>(config_.challenge_period))};
    OUTCOME_TRY(
        store_->update(id, [&](ChannelRecord &record) -> outcome::result<void> {
          record.onchain_nonce = payment.nonce;
          record.challenge_deadline = deadline;
          return outcome::success();
        }));
    log()->info("channel {} disputed at nonce {}, challenge ends {}",
                toHex0x(id),
                payment.nonce,
                clock::timestampToString(deadline));
    return DisputeResult{
        id, receipt.value().tx_hash, payment.amount, deadline};
  }

  outcome::result<void> LifecycleManager::extendChannel(
      const ChannelId &id, std::chrono::seconds duration) {
    if (duration.count() <= 0) {
      return ChannelError::kInvalidAmount;
    }
    return store_->update(
        id, [&](ChannelRecord &record) -> outcome::result<void> {
          if (record.channel.sender != self_
              || record.channel.state != ChannelState::kOpen) {
            return ChannelError::kInvalidState;
          }
          record.channel.expires_at +=
              std::chrono::duration_cast<Timestamp>(duration);
          return outcome::success();
        });
  }

  outcome::result<void> LifecycleManager::topUpChannel(
      const ChannelId &id, const TokenAmount &amount) {
    if (amount <= 0) {
      return ChannelError::kInvalidAmount;
    }
    OUTCOME_TRY(channel, store_->get(id));
    if (channel.sender != self_ || channel.state != ChannelState::kOpen) {
      return ChannelError::kInvalidState;
    }
    auto receipt{call(ledger::TopUpChannel{id, amount})};
    if (!receipt) {
      log()->error("top-up of channel {} failed: {}",
                   toHex0x(id),
                   receipt.error().message());
      return ChannelError::kLedgerCallFailed;
    }
    return store_->update(
        id, [&](ChannelRecord &record) -> outcome::result<void> {
          record.channel.deposit += amount;
          record.channel.balance += amount;
          ++record.topup_count;
          return outcome::success();
        });
  }

  outcome::result<Channel> LifecycleManager::reconcileSettlement(
      const ChannelId &id) {
    OUTCOME_TRY(snapshot, store_->getRecord(id));
    if (!snapshot.channel.settlement_unresolved || !snapshot.pending_call) {
      return ChannelError::kNoUnresolvedSettlement;
    }
    auto pending{*snapshot.pending_call};
    auto receipt{call(pending)};
    if (!receipt) {
      log()->error("reconciliation of channel {} failed: {}",
                   toHex0x(id),
                   receipt.error().message());
      if (receipt.error() == LedgerError::kTimeout) {
        return ChannelError::kSettlementUnresolved;
      }
      return ChannelError::kLedgerCallFailed;
    }

    auto now{clock_->nowMillis()};
    auto finish{[&](ChannelRecord &record) -> outcome::result<Channel> {
      if (!record.pending_call) {
        return ChannelError::kNoUnresolvedSettlement;
      }
      if (auto close{boost::get<ledger::CloseChannel>(&pending)}) {
        record.channel.state = ChannelState::kClosed;
        record.onchain_nonce = close->nonce;
      } else if (auto dispute{boost::get<ledger::DisputeChannel>(&pending)}) {
        record.channel.state = ChannelState::kDisputed;
        record.onchain_nonce = dispute->nonce;
        record.challenge_deadline =
            receipt.value().challenge_deadline.value_or(
                now
                + std::chrono::duration_cast<Timestamp>(
                    config_.challenge_period));
      }
      record.channel.settlement_unresolved = false;
      record.pending_call.reset();
      return record.channel;
    }};
    OUTCOME_TRY(channel, store_->update(id, finish));
    log()->info("settlement of channel {} reconciled, state {}",
                toHex0x(id),
                stateToString(channel.state));
    return channel;
  }

  outcome::result<void> LifecycleManager::trackChannel(const Channel &channel) {
    ChannelRecord record;
    record.channel = channel;
    return store_->insert(std::move(record));
  }

  outcome::result<ChannelId> LifecycleManager::makeChannelId(
      const Address &recipient) const {
    OUTCOME_TRY(salt, crypto::payment::randomSalt());
    auto now{clock_->nowMillis()};
    return crypto::payment::channelIdHash(
        self_, recipient, static_cast<uint64_t>(now.count()), salt);
  }

  outcome::result<ledger::LedgerReceipt> LifecycleManager::call(
      const ledger::LedgerCall &call) {
    return ledger::callBlocking(*ledger_, call, config_.ledger_timeout);
  }

  outcome::result<void> LifecycleManager::markUnresolved(
      const ChannelId &id,
      const ledger::LedgerCall &pending,
      ChannelState expected,
      boost::optional<ChannelState> state) {
    return store_->update(
        id, [&](ChannelRecord &record) -> outcome::result<void> {
          if (record.channel.state != expected) {
            return ChannelError::kInvalidState;
          }
          if (state) {
            record.channel.state = *state;
          }
          record.channel.settlement_unresolved = true;
          record.pending_call = pending;
          return outcome::success();
        });
  }
}  // namespace paychan::channels
