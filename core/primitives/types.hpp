/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include "common/bytes.hpp"
#include "primitives/big_int.hpp"

namespace paychan::primitives {
  using TokenAmount = BigInt;

  using Nonce = uint64_t;

  using Hash256 = BytesN<32>;

  /// bytes32 identifier of a payment channel
  using ChannelId = Hash256;
}  // namespace paychan::primitives
