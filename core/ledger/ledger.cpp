/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ledger/ledger.hpp"

namespace paychan::ledger {
  namespace {
    struct CallNameVisitor : boost::static_visitor<std::string> {
      std::string operator()(const OpenChannel &) const {
        return "openChannel";
      }
      std::string operator()(const CloseChannel &) const {
        return "closeChannel";
      }
      std::string operator()(const DisputeChannel &) const {
        return "disputeChannel";
      }
      std::string operator()(const TopUpChannel &) const {
        return "topUpChannel";
      }
    };
  }  // namespace

  std::string callName(const LedgerCall &call) {
    return boost::apply_visitor(CallNameVisitor{}, call);
  }
}  // namespace paychan::ledger

OUTCOME_CPP_DEFINE_CATEGORY(paychan::ledger, LedgerError, e) {
  using E = paychan::ledger::LedgerError;
  switch (e) {
    case E::kTimeout:
      return "Ledger: call timed out";
    case E::kUnknownChannel:
      return "Ledger: unknown channel";
    case E::kRejected:
      return "Ledger: call rejected";
    case E::kInsufficientFunds:
      return "Ledger: insufficient funds";
    case E::kBadSignature:
      return "Ledger: signature does not match channel sender";
    case E::kStaleNonce:
      return "Ledger: nonce is not greater than recorded one";
    case E::kNotDisputed:
      return "Ledger: channel is not disputed";
    case E::kChallengePeriodActive:
      return "Ledger: challenge period is not over";
  }
  return "Ledger: unknown error";
}
