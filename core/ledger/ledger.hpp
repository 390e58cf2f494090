/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>
#include <boost/variant.hpp>

#include "clock/time.hpp"
#include "common/async.hpp"
#include "crypto/signer/signer.hpp"
#include "primitives/address/address.hpp"
#include "primitives/types.hpp"

namespace paychan::ledger {
  using clock::Timestamp;
  using crypto::signer::Signature;
  using primitives::ChannelId;
  using primitives::Hash256;
  using primitives::Nonce;
  using primitives::TokenAmount;
  using primitives::address::Address;

  enum class LedgerError {
    kTimeout = 1,
    kUnknownChannel,
    kRejected,
    kInsufficientFunds,
    kBadSignature,
    kStaleNonce,
    kNotDisputed,
    kChallengePeriodActive,
  };

  /**
   * Locks deposit of sender in escrow for recipient.
   * `channel_id` is the id proposed by client, ledger may assign another one
   * and report it in receipt.
   */
  struct OpenChannel {
    ChannelId channel_id;
    Address sender;
    Address recipient;
    TokenAmount deposit;
  };

  /**
   * Cooperative settlement with latest signed state: recipient receives
   * `amount`, sender is refunded the rest of deposit. Channel without
   * payments closes with zero amount, zero nonce and no signature.
   */
  struct CloseChannel {
    ChannelId channel_id;
    TokenAmount amount;
    Nonce nonce{};
    boost::optional<Signature> signature;
  };

  /// Contested settlement, resolved after challenge period
  struct DisputeChannel {
    ChannelId channel_id;
    TokenAmount amount;
    Nonce nonce{};
    Signature signature{};
  };

  struct TopUpChannel {
    ChannelId channel_id;
    TokenAmount amount;
  };

  using LedgerCall =
      boost::variant<OpenChannel, CloseChannel, DisputeChannel, TopUpChannel>;

  struct LedgerReceipt {
    Hash256 tx_hash{};
    /// Confirmed id of opened channel
    boost::optional<ChannelId> channel_id;
    /// End of challenge window of accepted dispute
    boost::optional<Timestamp> challenge_deadline;
  };

  struct ChannelBalance {
    TokenAmount available;
    TokenAmount spent;
  };

  /**
   * On-chain contract custodying channel funds.
   * Every call is transactional: callback receives either receipt of final
   * state change, or error and nothing changed.
   */
  class Ledger {
   public:
    virtual ~Ledger() = default;

    virtual void submit(const LedgerCall &call, CbT<LedgerReceipt> cb) = 0;

    virtual void getChannelBalance(const ChannelId &channel_id,
                                   CbT<ChannelBalance> cb) = 0;
  };

  /// Human-readable call name for logs
  std::string callName(const LedgerCall &call);
}  // namespace paychan::ledger

OUTCOME_HPP_DECLARE_ERROR(paychan::ledger, LedgerError);
