/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/units.hpp"

#include <algorithm>

OUTCOME_CPP_DEFINE_CATEGORY(paychan::primitives, UnitsError, e) {
  using E = paychan::primitives::UnitsError;
  switch (e) {
    case E::kInvalidFormat:
      return "UnitsError: invalid decimal number";
    case E::kTooManyDecimals:
      return "UnitsError: too many fractional digits";
    case E::kOutOfRange:
      return "UnitsError: amount does not fit uint256";
  }
  return "UnitsError: unknown error";
}

namespace paychan::primitives {
  namespace {
    bool allDigits(std::string_view str) {
      return std::all_of(
          str.begin(), str.end(), [](char c) { return c >= '0' && c <= '9'; });
    }
  }  // namespace

  outcome::result<TokenAmount> parseUnits(std::string_view str,
                                          uint32_t decimals) {
    auto negative{false};
    if (!str.empty() && str[0] == '-') {
      negative = true;
      str.remove_prefix(1);
    }
    auto whole{str};
    std::string_view fraction;
    if (const auto dot{str.find('.')}; dot != std::string_view::npos) {
      whole = str.substr(0, dot);
      fraction = str.substr(dot + 1);
    }
    if ((whole.empty() && fraction.empty()) || !allDigits(whole)
        || !allDigits(fraction)) {
      return UnitsError::kInvalidFormat;
    }
    if (fraction.size() > decimals) {
      return UnitsError::kTooManyDecimals;
    }
    std::string digits{whole};
    digits.append(fraction);
    digits.append(decimals - fraction.size(), '0');
    const auto first{digits.find_first_not_of('0')};
    TokenAmount amount{0};
    if (first != std::string::npos) {
      amount = TokenAmount{digits.substr(first).c_str()};
    }
    if (!isUint256(amount)) {
      return UnitsError::kOutOfRange;
    }
    return negative ? TokenAmount{-amount} : amount;
  }

  std::string formatUnits(const TokenAmount &amount, uint32_t decimals) {
    const auto negative{amount < 0};
    auto digits{boost::multiprecision::abs(amount).str()};
    if (digits.size() <= decimals) {
      digits.insert(0, decimals - digits.size() + 1, '0');
    }
    auto whole{digits.substr(0, digits.size() - decimals)};
    auto fraction{digits.substr(digits.size() - decimals)};
    while (!fraction.empty() && fraction.back() == '0') {
      fraction.pop_back();
    }
    auto result{negative ? "-" + whole : whole};
    if (!fraction.empty()) {
      result += "." + fraction;
    }
    return result;
  }
}  // namespace paychan::primitives
