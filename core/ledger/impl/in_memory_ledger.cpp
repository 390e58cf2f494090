/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ledger/impl/in_memory_ledger.hpp"

#include "common/hexutil.hpp"
#include "common/logger.hpp"
#include "crypto/keccak/keccak.hpp"
#include "crypto/payment/payment_hash.hpp"
#include "primitives/units.hpp"

namespace paychan::ledger {
  using primitives::encodeUint256;
  using primitives::formatUnits;

  inline auto &log() {
    static auto log{common::createLogger("InMemoryLedger")};
    return log;
  }

  namespace {
    struct ApplyVisitor : boost::static_visitor<outcome::result<LedgerReceipt>> {
      explicit ApplyVisitor(InMemoryLedger &ledger) : ledger{ledger} {}

      template <typename T>
      outcome::result<LedgerReceipt> operator()(const T &call) const {
        return ledger.apply(call);
      }

      InMemoryLedger &ledger;
    };
  }  // namespace

  InMemoryLedger::InMemoryLedger(std::shared_ptr<Signer> signer,
                                 std::shared_ptr<clock::UTCClock> clock,
                                 std::chrono::seconds challenge_period)
      : signer_{std::move(signer)},
        clock_{std::move(clock)},
        challenge_period_{challenge_period} {}

  void InMemoryLedger::submit(const LedgerCall &call, CbT<LedgerReceipt> cb) {
    auto receipt{[&] {
      std::lock_guard lock{mutex_};
      return boost::apply_visitor(ApplyVisitor{*this}, call);
    }()};
    if (!receipt) {
      log()->warn("{} rejected: {}", callName(call), receipt.error().message());
    }
    cb(std::move(receipt));
  }

  void InMemoryLedger::getChannelBalance(const ChannelId &channel_id,
                                         CbT<ChannelBalance> cb) {
    auto balance{[&]() -> outcome::result<ChannelBalance> {
      std::lock_guard lock{mutex_};
      auto it{escrows_.find(channel_id)};
      if (it == escrows_.end()) {
        return LedgerError::kUnknownChannel;
      }
      const auto &escrow{it->second};
      if (escrow.settled) {
        return ChannelBalance{0, escrow.paid};
      }
      return ChannelBalance{escrow.deposit, escrow.paid};
    }()};
    cb(std::move(balance));
  }

  void InMemoryLedger::fund(const Address &address, const TokenAmount &amount) {
    std::lock_guard lock{mutex_};
    balances_[address] += amount;
  }

  TokenAmount InMemoryLedger::balanceOf(const Address &address) const {
    std::lock_guard lock{mutex_};
    auto it{balances_.find(address)};
    if (it == balances_.end()) {
      return 0;
    }
    return it->second;
  }

  outcome::result<void> InMemoryLedger::resolveDispute(
      const ChannelId &channel_id, Timestamp now) {
    std::lock_guard lock{mutex_};
    OUTCOME_TRY(escrow, findOpen(channel_id));
    if (!escrow->dispute) {
      return LedgerError::kNotDisputed;
    }
    if (now <= escrow->dispute->deadline) {
      return LedgerError::kChallengePeriodActive;
    }
    auto dispute{*escrow->dispute};
    escrow->dispute.reset();
    payout(*escrow, dispute.amount, dispute.nonce);
    log()->info("dispute on {} resolved at nonce {}, recipient gets {}",
                common::toHex0x(channel_id),
                dispute.nonce,
                formatUnits(dispute.amount));
    return outcome::success();
  }

  outcome::result<Nonce> InMemoryLedger::channelNonce(
      const ChannelId &channel_id) const {
    std::lock_guard lock{mutex_};
    auto it{escrows_.find(channel_id)};
    if (it == escrows_.end()) {
      return LedgerError::kUnknownChannel;
    }
    return it->second.nonce;
  }

  outcome::result<LedgerReceipt> InMemoryLedger::apply(
      const OpenChannel &call) {
    if (call.deposit <= 0 || escrows_.count(call.channel_id) != 0) {
      return LedgerError::kRejected;
    }
    auto &balance{balances_[call.sender]};
    if (balance < call.deposit) {
      return LedgerError::kInsufficientFunds;
    }
    balance -= call.deposit;
    escrows_.emplace(call.channel_id,
                     Escrow{call.sender, call.recipient, call.deposit, 0});
    return LedgerReceipt{nextTxHash(), call.channel_id, boost::none};
  }

  outcome::result<LedgerReceipt> InMemoryLedger::apply(
      const CloseChannel &call) {
    OUTCOME_TRY(escrow, findOpen(call.channel_id));
    if (escrow->dispute) {
      return LedgerError::kRejected;
    }
    if (call.signature) {
      OUTCOME_TRY(checkState(*escrow,
                             call.channel_id,
                             call.amount,
                             call.nonce,
                             *call.signature));
    } else if (call.amount != 0 || call.nonce != 0) {
      return LedgerError::kBadSignature;
    }
    payout(*escrow, call.amount, call.nonce);
    return LedgerReceipt{nextTxHash(), boost::none, boost::none};
  }

  outcome::result<LedgerReceipt> InMemoryLedger::apply(
      const DisputeChannel &call) {
    OUTCOME_TRY(escrow, findOpen(call.channel_id));
    OUTCOME_TRY(checkState(
        *escrow, call.channel_id, call.amount, call.nonce, call.signature));
    if (escrow->dispute) {
      if (call.nonce <= escrow->dispute->nonce) {
        return LedgerError::kStaleNonce;
      }
      escrow->dispute->amount = call.amount;
      escrow->dispute->nonce = call.nonce;
    } else {
      escrow->dispute = Dispute{
          call.amount,
          call.nonce,
          clock_->nowMillis()
              + std::chrono::duration_cast<Timestamp>(challenge_period_)};
    }
    return LedgerReceipt{
        nextTxHash(), boost::none, escrow->dispute->deadline};
  }

  outcome::result<LedgerReceipt> InMemoryLedger::apply(
      const TopUpChannel &call) {
    if (call.amount <= 0) {
      return LedgerError::kRejected;
    }
    OUTCOME_TRY(escrow, findOpen(call.channel_id));
    auto &balance{balances_[escrow->sender]};
    if (balance < call.amount) {
      return LedgerError::kInsufficientFunds;
    }
    balance -= call.amount;
    escrow->deposit += call.amount;
    return LedgerReceipt{nextTxHash(), boost::none, boost::none};
  }

  outcome::result<InMemoryLedger::Escrow *> InMemoryLedger::findOpen(
      const ChannelId &channel_id) {
    auto it{escrows_.find(channel_id)};
    if (it == escrows_.end()) {
      return LedgerError::kUnknownChannel;
    }
    if (it->second.settled) {
      return LedgerError::kRejected;
    }
    return &it->second;
  }

  outcome::result<void> InMemoryLedger::checkState(
      const Escrow &escrow,
      const ChannelId &channel_id,
      const TokenAmount &amount,
      Nonce nonce,
      const Signature &signature) const {
    if (nonce <= escrow.nonce) {
      return LedgerError::kStaleNonce;
    }
    if (amount < 0 || amount > escrow.deposit) {
      return LedgerError::kRejected;
    }
    OUTCOME_TRY(hash, crypto::payment::paymentHash(channel_id, amount, nonce));
    auto signer{signer_->recover(hash, signature)};
    if (!signer || signer.value() != escrow.sender) {
      return LedgerError::kBadSignature;
    }
    return outcome::success();
  }

  void InMemoryLedger::payout(Escrow &escrow,
                              const TokenAmount &amount,
                              Nonce nonce) {
    balances_[escrow.recipient] += amount;
    balances_[escrow.sender] += escrow.deposit - amount;
    escrow.paid = amount;
    escrow.nonce = nonce;
    escrow.settled = true;
  }

  Hash256 InMemoryLedger::nextTxHash() {
    ++tx_count_;
    return crypto::keccak::keccak256(encodeUint256(tx_count_));
  }
}  // namespace paychan::ledger
