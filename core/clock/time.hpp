/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string>

#include "common/outcome.hpp"

namespace paychan::clock {
  enum class TimeFromStringError { kInvalidFormat = 1 };

  using std::chrono::microseconds;
  using std::chrono::milliseconds;
  /// Millisecond precision point in time since unix epoch
  using Timestamp = milliseconds;

  /// "YYYY-MM-DDTHH:MM:SS.mmmZ"
  std::string timestampToString(Timestamp time);
  outcome::result<Timestamp> timestampFromString(const std::string &str);
}  // namespace paychan::clock

OUTCOME_HPP_DECLARE_ERROR(paychan::clock, TimeFromStringError);
