/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <memory>

#include "channels/channel_store.hpp"
#include "clock/utc_clock.hpp"
#include "crypto/signer/signer.hpp"
#include "ledger/ledger.hpp"

namespace paychan::channels {
  using crypto::signer::Signer;

  struct LifecycleConfig {
    std::chrono::seconds default_duration{86400};
    std::chrono::milliseconds ledger_timeout{std::chrono::seconds{30}};
    /// Used when ledger does not report dispute deadline
    std::chrono::seconds challenge_period{3600};
  };

  /**
   * Drives channel through
   * open -> closing -> closed and open/closing -> disputed,
   * talking to ledger without holding channel lock.
   * Close, extend and top-up act only on channels whose sender is `self`,
   * tracked copies of counterparty channels can only be disputed.
   */
  class LifecycleManager {
   public:
    LifecycleManager(std::shared_ptr<ChannelStore> store,
                     std::shared_ptr<ledger::Ledger> ledger,
                     std::shared_ptr<Signer> signer,
                     std::shared_ptr<clock::UTCClock> clock,
                     const Address &self,
                     LifecycleConfig config);

    /**
     * Locks deposit on ledger and stores open channel.
     * Nothing is stored if ledger call fails.
     */
    outcome::result<Channel> createChannel(const CreateChannelParams &params);

    /**
     * Settles latest signed state: recipient receives spent, sender gets
     * balance back.
     * @return kSettlementUnresolved if ledger rejected or did not answer in
     * time, channel carries unresolved marker then
     */
    outcome::result<SettlementResult> closeChannel(const ChannelId &id);

    /**
     * Escalates payment signed by sender with nonce above last on-chain
     * nonce.
     */
    outcome::result<DisputeResult> disputeChannel(const ChannelId &id,
                                                  const SignedPayment &payment);

    /// Moves expiry of open channel forward, local only
    outcome::result<void> extendChannel(const ChannelId &id,
                                        std::chrono::seconds duration);

    outcome::result<void> topUpChannel(const ChannelId &id,
                                       const TokenAmount &amount);

    /// Resubmits close or dispute of channel with unresolved settlement
    outcome::result<Channel> reconcileSettlement(const ChannelId &id);

    /// Stores recipient side copy of channel opened by counterparty
    outcome::result<void> trackChannel(const Channel &channel);

    /// keccak256(self, recipient, now ms, random salt)
    outcome::result<ChannelId> makeChannelId(const Address &recipient) const;

   private:
    outcome::result<ledger::LedgerReceipt> call(const ledger::LedgerCall &call);

    /**
     * Marks settlement unresolved and moves channel to `state` if given.
     * @return kInvalidState if channel left `expected` state meanwhile
     */
    outcome::result<void> markUnresolved(const ChannelId &id,
                                         const ledger::LedgerCall &pending,
                                         ChannelState expected,
                                         boost::optional<ChannelState> state);

    std::shared_ptr<ChannelStore> store_;
    std::shared_ptr<ledger::Ledger> ledger_;
    std::shared_ptr<Signer> signer_;
    std::shared_ptr<clock::UTCClock> clock_;
    Address self_;
    LifecycleConfig config_;
  };
}  // namespace paychan::channels
