/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "channels/channel_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(paychan::channels, ChannelError, e) {
  using E = paychan::channels::ChannelError;
  switch (e) {
    case E::kChannelNotFound:
      return "Channel: not found";
    case E::kDuplicateChannel:
      return "Channel: channel with this id already exists";
    case E::kInvalidState:
      return "Channel: operation is not valid in current channel state";
    case E::kAlreadyClosed:
      return "Channel: already closed";
    case E::kChannelExpired:
      return "Channel: expired";
    case E::kInsufficientChannelBalance:
      return "Channel: insufficient channel balance";
    case E::kEmptyBatch:
      return "Channel: no payments in batch";
    case E::kInvalidAmount:
      return "Channel: amount must be positive";
    case E::kNonceOverflow:
      return "Channel: nonce overflow";
    case E::kSignatureVerificationFailed:
      return "Channel: signature verification failed";
    case E::kStaleNonce:
      return "Channel: nonce is not greater than last on-chain nonce";
    case E::kReplayedPayment:
      return "Channel: payment nonce already acknowledged";
    case E::kPaymentChannelMismatch:
      return "Channel: payment is for another channel";
    case E::kLedgerCallFailed:
      return "Channel: ledger call failed";
    case E::kSettlementUnresolved:
      return "Channel: settlement was not confirmed by ledger";
    case E::kNoUnresolvedSettlement:
      return "Channel: no unresolved settlement";
  }
  return "Channel: unknown error";
}
