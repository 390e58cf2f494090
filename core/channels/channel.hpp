/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "clock/time.hpp"
#include "common/cmp.hpp"
#include "crypto/signer/signer.hpp"
#include "ledger/ledger.hpp"
#include "primitives/address/address.hpp"
#include "primitives/types.hpp"

namespace paychan::channels {
  using clock::Timestamp;
  using crypto::signer::Signature;
  using primitives::ChannelId;
  using primitives::Hash256;
  using primitives::Nonce;
  using primitives::TokenAmount;
  using primitives::address::Address;

  enum class ChannelState {
    kPending,
    kOpen,
    kClosing,
    kClosed,
    kDisputed,
  };

  std::string stateToString(ChannelState state);

  /**
   * Auto top-up policy: when balance drops to `threshold` or below after a
   * payment, deposit is increased by `amount`, at most `max_topups` times.
   */
  struct AutoTopupConfig {
    TokenAmount threshold;
    TokenAmount amount;
    /// none means unlimited
    boost::optional<uint64_t> max_topups;
  };

  struct Channel {
    ChannelId id{};
    Address sender;
    Address recipient;
    TokenAmount deposit;
    TokenAmount spent;
    /// deposit - spent
    TokenAmount balance;
    ChannelState state{ChannelState::kPending};
    Nonce nonce{0};
    Timestamp created_at{};
    Timestamp expires_at{};
    /// Signature of (id, spent, nonce), none before first payment
    boost::optional<Signature> last_signature;
    /// Ledger never confirmed close or dispute, see reconcileSettlement
    bool settlement_unresolved{false};
  };

  /// Sender attestation of cumulative amount owed at nonce
  struct SignedPayment {
    ChannelId channel_id{};
    /// Cumulative total, not increment
    TokenAmount amount;
    Nonce nonce{0};
    Signature signature{};
    Timestamp timestamp{};

    bool operator==(const SignedPayment &other) const {
      return channel_id == other.channel_id && amount == other.amount
             && nonce == other.nonce && signature == other.signature
             && timestamp == other.timestamp;
    }
  };
  PAYCHAN_OPERATOR_NOT_EQUAL(SignedPayment)

  struct PaymentRecord {
    TokenAmount amount;
    Timestamp timestamp{};
  };

  /// Recipient acknowledgment of verified payment
  struct PaymentReceipt {
    std::string receipt_id;
    ChannelId channel_id{};
    /// Increment over previously acknowledged total
    TokenAmount amount;
    TokenAmount total_spent;
    Nonce nonce{0};
    Timestamp timestamp{};
  };

  struct BatchPaymentItem {
    TokenAmount amount;
    std::string memo;
  };

  struct BatchPaymentEntry {
    TokenAmount amount;
    std::string memo;
    Nonce nonce{0};
  };

  struct BatchPaymentReceipt {
    Signature signature{};
    std::vector<BatchPaymentEntry> payments;
    TokenAmount total_amount;
    size_t count{0};
    Timestamp timestamp{};
    /// The only state signed for the whole batch
    SignedPayment payment;
  };

  struct SettlementResult {
    ChannelId channel_id{};
    Hash256 tx_hash{};
    TokenAmount final_amount;
    TokenAmount refund_amount;
    Timestamp settled_at{};
  };

  struct DisputeResult {
    ChannelId channel_id{};
    Hash256 tx_hash{};
    TokenAmount disputed_amount;
    Timestamp challenge_ends_at{};
  };

  struct AutoTopupStatus {
    bool enabled{false};
    TokenAmount threshold;
    TokenAmount topup_amount;
    /// none means unlimited
    boost::optional<uint64_t> topups_remaining;
    uint64_t total_topups{0};
  };

  struct ChannelStats {
    size_t total_channels{0};
    size_t open_channels{0};
    TokenAmount total_deposited;
    TokenAmount total_spent;
    /// Balance left in closed channels
    TokenAmount total_refunded;
  };

  struct ExtendedChannelStats {
    uint64_t total_payments{0};
    TokenAmount total_volume;
    TokenAmount average_payment;
    TokenAmount largest_payment;
    TokenAmount smallest_payment;
    double payments_per_hour{0};
    /// Seconds since creation
    uint64_t channel_age{0};
    uint64_t topup_count{0};
  };

  struct PaymentRequest {
    std::string request_id;
    ChannelId channel_id{};
    TokenAmount amount;
    std::string description;
    Timestamp expires_at{};
  };

  struct CreateChannelParams {
    Address recipient;
    TokenAmount deposit;
    /// Default duration from config if none
    boost::optional<std::chrono::seconds> duration;
    boost::optional<AutoTopupConfig> auto_topup;
  };

  /**
   * Everything stored per channel.
   * Mutated only inside ChannelStore::update.
   */
  struct ChannelRecord {
    Channel channel;
    std::vector<PaymentRecord> history;
    boost::optional<AutoTopupConfig> auto_topup;
    /// Automatic top-ups confirmed by ledger
    uint64_t auto_topups{0};
    /// Automatic top-ups submitted to ledger and not confirmed yet
    uint64_t reserved_topups{0};
    /// Manual and automatic top-ups
    uint64_t topup_count{0};
    /// Nonce of last state accepted by ledger
    Nonce onchain_nonce{0};
    boost::optional<Timestamp> challenge_deadline;
    /// Close or dispute call to resubmit when settlement is unresolved
    boost::optional<ledger::LedgerCall> pending_call;
  };
}  // namespace paychan::channels
