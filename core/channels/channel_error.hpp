/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace paychan::channels {
  enum class ChannelError {
    kChannelNotFound = 1,
    kDuplicateChannel,
    kInvalidState,
    kAlreadyClosed,
    kChannelExpired,
    kInsufficientChannelBalance,
    kEmptyBatch,
    kInvalidAmount,
    kNonceOverflow,
    kSignatureVerificationFailed,
    kStaleNonce,
    kReplayedPayment,
    kPaymentChannelMismatch,
    kLedgerCallFailed,
    kSettlementUnresolved,
    kNoUnresolvedSettlement,
  };
}  // namespace paychan::channels

OUTCOME_HPP_DECLARE_ERROR(paychan::channels, ChannelError);
