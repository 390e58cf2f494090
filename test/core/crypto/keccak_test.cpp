/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/keccak/keccak.hpp"

#include <gtest/gtest.h>

#include "testutil/literals.hpp"

namespace paychan::crypto::keccak {
  /**
   * @given empty input
   * @when keccak256
   * @then matches Ethereum empty hash
   */
  TEST(Keccak, Empty) {
    EXPECT_EQ(
        keccak256(Bytes{}),
        "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470"_hash256);
  }

  /**
   * @given "abc"
   * @when keccak256
   * @then original Keccak padding is used, not SHA3
   */
  TEST(Keccak, Abc) {
    const std::string abc{"abc"};
    EXPECT_EQ(
        keccak256(Bytes{abc.begin(), abc.end()}),
        "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45"_hash256);
  }

  /**
   * @given input longer than several blocks
   * @when hashed in uneven chunks
   * @then same as one shot hash
   */
  TEST(Keccak, Incremental) {
    Bytes data(3 * kKeccak256Rate + 17);
    for (size_t i{0}; i < data.size(); ++i) {
      data[i] = static_cast<uint8_t>(i * 7);
    }
    BytesIn span{data};
    Ctx ctx;
    ctx.update(span.subspan(0, 1));
    ctx.update(span.subspan(1, kKeccak256Rate));
    ctx.update(span.subspan(kKeccak256Rate + 1));
    EXPECT_EQ(ctx.final(), keccak256(data));
  }

  /**
   * @given input of exactly one block
   * @when keccak256
   * @then differs from input one byte shorter
   */
  TEST(Keccak, BlockBoundary) {
    Bytes block(kKeccak256Rate, 0x61);
    Bytes shorter(kKeccak256Rate - 1, 0x61);
    EXPECT_NE(keccak256(block), keccak256(shorter));
  }
}  // namespace paychan::crypto::keccak
