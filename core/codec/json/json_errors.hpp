/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace paychan::codec::json {
  enum class JsonError {
    kWrongLength = 1,
    kWrongType,
    kOutOfRange,
    kParseError,
    kWrongValue,
  };
}  // namespace paychan::codec::json

OUTCOME_HPP_DECLARE_ERROR(paychan::codec::json, JsonError);
