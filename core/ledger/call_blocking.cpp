/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ledger/call_blocking.hpp"

namespace paychan::ledger {
  outcome::result<LedgerReceipt> callBlocking(
      Ledger &ledger,
      const LedgerCall &call,
      std::chrono::milliseconds timeout) {
    return waitCb<LedgerReceipt>(
        [&](auto cb) { ledger.submit(call, std::move(cb)); }, timeout);
  }

  outcome::result<ChannelBalance> getChannelBalanceBlocking(
      Ledger &ledger,
      const ChannelId &channel_id,
      std::chrono::milliseconds timeout) {
    return waitCb<ChannelBalance>(
        [&](auto cb) { ledger.getChannelBalance(channel_id, std::move(cb)); },
        timeout);
  }
}  // namespace paychan::ledger
