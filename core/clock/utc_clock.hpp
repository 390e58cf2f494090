/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/time.hpp"

namespace paychan::clock {
  /**
   * Provides current UTC time
   */
  class UTCClock {
   public:
    inline auto nowMillis() const {
      return std::chrono::duration_cast<Timestamp>(nowMicro());
    }
    virtual microseconds nowMicro() const = 0;
    virtual ~UTCClock() = default;
  };
}  // namespace paychan::clock
