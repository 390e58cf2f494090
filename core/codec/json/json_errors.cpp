/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/json/json_errors.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(paychan::codec::json, JsonError, e) {
  using E = paychan::codec::json::JsonError;
  switch (e) {
    case E::kWrongLength:
      return "wrong length";
    case E::kWrongType:
      return "wrong type";
    case E::kOutOfRange:
      return "out of range";
    case E::kParseError:
      return "parse error";
    case E::kWrongValue:
      return "wrong value";
  }

  return "unknown JsonError error code";
}
