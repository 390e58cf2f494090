/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/big_int.hpp"

namespace paychan::primitives {
  outcome::result<BytesN<32>> encodeUint256(const BigInt &value) {
    if (!isUint256(value)) {
      return BigIntError::kOutOfUint256Range;
    }
    BytesN<32> out{};
    Bytes bytes;
    if (value != 0) {
      export_bits(value, std::back_inserter(bytes), 8);
    }
    std::copy(bytes.begin(), bytes.end(), out.end() - bytes.size());
    return out;
  }

  BytesN<32> encodeUint256(uint64_t value) {
    BytesN<32> out{};
    for (auto it{out.rbegin()}; value != 0; ++it, value >>= 8) {
      *it = static_cast<uint8_t>(value);
    }
    return out;
  }
}  // namespace paychan::primitives

OUTCOME_CPP_DEFINE_CATEGORY(paychan::primitives, BigIntError, e) {
  using E = paychan::primitives::BigIntError;
  switch (e) {
    case E::kOutOfUint256Range:
      return "BigInt: value is negative or does not fit uint256";
  }
  return "BigInt: unknown error";
}
