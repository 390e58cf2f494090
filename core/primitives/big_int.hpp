/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace paychan::primitives {
  using BigInt = boost::multiprecision::cpp_int;

  enum class BigIntError {
    kOutOfUint256Range = 1,
  };

  /// Value fits solidity uint256, i.e. lies in [0, 2^256)
  inline bool isUint256(const BigInt &value) {
    return value >= 0 && (value >> 256) == 0;
  }

  /// Solidity uint256 encoding, big-endian, left padded with zeros
  outcome::result<BytesN<32>> encodeUint256(const BigInt &value);

  BytesN<32> encodeUint256(uint64_t value);
}  // namespace paychan::primitives

OUTCOME_HPP_DECLARE_ERROR(paychan::primitives, BigIntError);
