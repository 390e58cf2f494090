/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <string>
#include <string_view>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace paychan::common {
  enum class HexError {
    kWrongLength = 1,
  };
}  // namespace paychan::common

OUTCOME_HPP_DECLARE_ERROR(paychan::common, HexError);

namespace paychan::common {
  /// Lowercase hex with "0x" prefix
  std::string toHex0x(BytesIn bytes);

  /**
   * Decodes hex string, "0x" prefix is optional, digits are case-insensitive
   * @param hex - string to decode
   * @return decoded bytes or libp2p unhex error
   */
  outcome::result<Bytes> fromHex(std::string_view hex);

  /**
   * Decodes hex string into fixed size array
   * @return kWrongLength if decoded length differs from N
   */
  template <size_t N>
  outcome::result<BytesN<N>> fromHexN(std::string_view hex) {
    OUTCOME_TRY(bytes, fromHex(hex));
    if (bytes.size() != N) {
      return HexError::kWrongLength;
    }
    BytesN<N> out{};
    std::copy(bytes.begin(), bytes.end(), out.begin());
    return out;
  }
}  // namespace paychan::common
