/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "ledger/ledger.hpp"

namespace paychan::ledger {
  class LedgerMock : public Ledger {
   public:
    MOCK_METHOD2(submit, void(const LedgerCall &, CbT<LedgerReceipt>));

    MOCK_METHOD2(getChannelBalance,
                 void(const ChannelId &, CbT<ChannelBalance>));
  };
}  // namespace paychan::ledger
