/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <string>
#include <string_view>

#include "common/bytes.hpp"
#include "common/cmp.hpp"
#include "common/outcome.hpp"

namespace paychan::primitives::address {
  constexpr size_t kAddressLength = 20;

  enum class AddressError {
    kInvalidLength = 1,
    kInvalidHex,
  };

  /**
   * 20-byte account address.
   * Textual form is "0x" followed by 40 hex digits, parsing is
   * case-insensitive so checksummed and lowercase forms compare equal.
   */
  struct Address {
    BytesN<kAddressLength> bytes{};

    static outcome::result<Address> fromString(std::string_view str);

    /// Lowercase "0x..." form
    std::string toString() const;

    bool operator==(const Address &other) const {
      return bytes == other.bytes;
    }
    bool operator<(const Address &other) const {
      return bytes < other.bytes;
    }
  };
  PAYCHAN_OPERATOR_NOT_EQUAL(Address)
}  // namespace paychan::primitives::address

OUTCOME_HPP_DECLARE_ERROR(paychan::primitives::address, AddressError);
