/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/address/address.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

namespace paychan::primitives::address {
  /**
   * @given checksummed and lowercase forms of one address
   * @when fromString
   * @then equal addresses with lowercase string form
   */
  TEST(Address, CaseInsensitive) {
    EXPECT_OUTCOME_TRUE(
        checksummed,
        Address::fromString("0x2c7536E3605D9C16a7a3D7b1898e529396a65c23"));
    EXPECT_OUTCOME_TRUE(
        lower,
        Address::fromString("0x2c7536e3605d9c16a7a3d7b1898e529396a65c23"));
    EXPECT_EQ(checksummed, lower);
    EXPECT_EQ(lower.toString(), "0x2c7536e3605d9c16a7a3d7b1898e529396a65c23");
  }

  /**
   * @given address without 0x prefix
   * @when fromString
   * @then parsed
   */
  TEST(Address, NoPrefix) {
    EXPECT_OUTCOME_TRUE(
        address,
        Address::fromString("00000000000000000000000000000000000000ab"));
    EXPECT_EQ(address.bytes[19], 0xab);
  }

  /**
   * @given malformed strings
   * @when fromString
   * @then error
   */
  TEST(Address, Invalid) {
    EXPECT_OUTCOME_ERROR(AddressError::kInvalidLength,
                         Address::fromString("0x1234"));
    EXPECT_OUTCOME_ERROR(
        AddressError::kInvalidHex,
        Address::fromString("0xzz7536e3605d9c16a7a3d7b1898e529396a65c23"));
  }
}  // namespace paychan::primitives::address
