/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <libp2p/common/hexutil.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(paychan::common, HexError, e) {
  using E = paychan::common::HexError;
  switch (e) {
    case E::kWrongLength:
      return "HexError: decoded value has wrong length";
  }
  return "HexError: unknown error";
}

namespace paychan::common {
  std::string toHex0x(BytesIn bytes) {
    return "0x" + libp2p::common::hex_lower(bytes);
  }

  outcome::result<Bytes> fromHex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
      hex.remove_prefix(2);
    }
    return libp2p::common::unhex(hex);
  }
}  // namespace paychan::common
