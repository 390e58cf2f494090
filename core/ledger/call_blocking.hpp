/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <future>
#include <memory>

#include "ledger/ledger.hpp"

namespace paychan::ledger {
  /**
   * Waits for callback style call at most `timeout`.
   * Promise is shared with callback, so callback arriving after timeout is
   * harmless.
   * @param call - function taking callback
   * @return callback result or kTimeout
   */
  template <typename T, typename F>
  outcome::result<T> waitCb(const F &call, std::chrono::milliseconds timeout) {
    auto wait{std::make_shared<std::promise<outcome::result<T>>>()};
    auto future{wait->get_future()};
    call([wait](outcome::result<T> res) { wait->set_value(std::move(res)); });
    if (future.wait_for(timeout) != std::future_status::ready) {
      return LedgerError::kTimeout;
    }
    return future.get();
  }

  /// Submits call and waits for receipt at most `timeout`
  outcome::result<LedgerReceipt> callBlocking(
      Ledger &ledger,
      const LedgerCall &call,
      std::chrono::milliseconds timeout);

  outcome::result<ChannelBalance> getChannelBalanceBlocking(
      Ledger &ledger,
      const ChannelId &channel_id,
      std::chrono::milliseconds timeout);
}  // namespace paychan::ledger
