/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>

#include "clock/utc_clock.hpp"
#include "crypto/signer/signer.hpp"
#include "ledger/ledger.hpp"

namespace paychan::ledger {
  using crypto::signer::Signer;

  /**
   * Channel contract kept in process memory.
   * Custodies deposits, checks settlement signatures against channel sender
   * and pays out to per-address balances. Disputes are resolved by the
   * highest nonce state submitted before challenge deadline.
   * Callbacks are called synchronously from submit.
   */
  class InMemoryLedger : public Ledger {
   public:
    InMemoryLedger(std::shared_ptr<Signer> signer,
                   std::shared_ptr<clock::UTCClock> clock,
                   std::chrono::seconds challenge_period);

    void submit(const LedgerCall &call, CbT<LedgerReceipt> cb) override;

    void getChannelBalance(const ChannelId &channel_id,
                           CbT<ChannelBalance> cb) override;

    /// Credits free balance of address
    void fund(const Address &address, const TokenAmount &amount);

    /// Free (not escrowed) balance of address
    TokenAmount balanceOf(const Address &address) const;

    /**
     * Pays out highest nonce disputed state
     * @param now - current time, must be after challenge deadline
     */
    outcome::result<void> resolveDispute(const ChannelId &channel_id,
                                         Timestamp now);

    /// Nonce of last state accepted on chain, 0 if none
    outcome::result<Nonce> channelNonce(const ChannelId &channel_id) const;

    outcome::result<LedgerReceipt> apply(const OpenChannel &call);
    outcome::result<LedgerReceipt> apply(const CloseChannel &call);
    outcome::result<LedgerReceipt> apply(const DisputeChannel &call);
    outcome::result<LedgerReceipt> apply(const TopUpChannel &call);

   private:
    struct Dispute {
      TokenAmount amount;
      Nonce nonce{};
      Timestamp deadline{};
    };

    struct Escrow {
      Address sender;
      Address recipient;
      TokenAmount deposit;
      TokenAmount paid;
      Nonce nonce{};
      bool settled{false};
      boost::optional<Dispute> dispute;
    };

    outcome::result<Escrow *> findOpen(const ChannelId &channel_id);

    outcome::result<void> checkState(const Escrow &escrow,
                                     const ChannelId &channel_id,
                                     const TokenAmount &amount,
                                     Nonce nonce,
                                     const Signature &signature) const;

    void payout(Escrow &escrow, const TokenAmount &amount, Nonce nonce);

    Hash256 nextTxHash();

    std::shared_ptr<Signer> signer_;
    std::shared_ptr<clock::UTCClock> clock_;
    std::chrono::seconds challenge_period_;

    mutable std::mutex mutex_;
    std::map<ChannelId, Escrow> escrows_;
    std::map<Address, TokenAmount> balances_;
    uint64_t tx_count_{0};
  };
}  // namespace paychan::ledger
