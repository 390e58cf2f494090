/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <memory>

#include "channels/channel_store.hpp"
#include "ledger/ledger.hpp"

namespace paychan::channels {
  /**
   * Tops up channel deposit when balance falls to configured threshold.
   * Top-up slot is reserved under channel lock before ledger call, so
   * concurrent payments never exceed max_topups.
   */
  class AutoTopupEngine {
   public:
    AutoTopupEngine(std::shared_ptr<ChannelStore> store,
                    std::shared_ptr<ledger::Ledger> ledger,
                    std::chrono::milliseconds ledger_timeout);

    /**
     * Runs policy once for channel, called after every successful payment.
     * Failures are logged and never reported to payer.
     * @return true if deposit was topped up
     */
    bool check(const ChannelId &id);

    /// Replaces policy, performed top-ups still count against max_topups
    outcome::result<void> updateAutoTopup(const ChannelId &id,
                                          const AutoTopupConfig &config);

    outcome::result<void> disableAutoTopup(const ChannelId &id);

    outcome::result<AutoTopupStatus> getAutoTopupStatus(
        const ChannelId &id) const;

   private:
    std::shared_ptr<ChannelStore> store_;
    std::shared_ptr<ledger::Ledger> ledger_;
    std::chrono::milliseconds ledger_timeout_;
  };
}  // namespace paychan::channels
