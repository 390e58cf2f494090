/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "primitives/types.hpp"

namespace paychan::primitives {
  /// USDC token decimals
  constexpr uint32_t kDefaultDecimals = 6;

  enum class UnitsError {
    kInvalidFormat = 1,
    kTooManyDecimals,
    kOutOfRange,
  };

  /**
   * Converts decimal string to base units, e.g. "1.5" with 6 decimals is
   * 1500000. Negative values are allowed with leading '-', magnitude must fit
   * uint256.
   * @param str - decimal string, no exponent
   * @param decimals - token decimals
   */
  outcome::result<TokenAmount> parseUnits(std::string_view str,
                                          uint32_t decimals = kDefaultDecimals);

  /**
   * Converts base units to shortest decimal string, e.g. 1500000 with 6
   * decimals is "1.5", 0 is "0".
   */
  std::string formatUnits(const TokenAmount &amount,
                          uint32_t decimals = kDefaultDecimals);
}  // namespace paychan::primitives

OUTCOME_HPP_DECLARE_ERROR(paychan::primitives, UnitsError);
