/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/address/address.hpp"

#include "common/hexutil.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(paychan::primitives::address, AddressError, e) {
  using E = paychan::primitives::address::AddressError;
  switch (e) {
    case E::kInvalidLength:
      return "AddressError: address must be 20 bytes";
    case E::kInvalidHex:
      return "AddressError: address is not valid hex";
  }
  return "AddressError: unknown error";
}

namespace paychan::primitives::address {
  outcome::result<Address> Address::fromString(std::string_view str) {
    auto bytes{common::fromHex(str)};
    if (!bytes) {
      return AddressError::kInvalidHex;
    }
    if (bytes.value().size() != kAddressLength) {
      return AddressError::kInvalidLength;
    }
    Address address;
    std::copy(
        bytes.value().begin(), bytes.value().end(), address.bytes.begin());
    return address;
  }

  std::string Address::toString() const {
    return common::toHex0x(bytes);
  }
}  // namespace paychan::primitives::address
