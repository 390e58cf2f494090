/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/bytes.hpp"
#include "primitives/types.hpp"

namespace paychan::crypto::keccak {
  using primitives::Hash256;

  /// Rate of Keccak-256 sponge in bytes
  constexpr size_t kKeccak256Rate = 136;

  /**
   * Incremental Keccak-256 as used by Ethereum (original submission padding
   * 0x01, not the NIST SHA3 0x06 padding) over ethash keccak-f[1600]
   */
  struct Ctx {
    void update(BytesIn in);
    Hash256 final();
    void _absorb();

    std::array<uint64_t, 25> state{};
    std::array<uint8_t, kKeccak256Rate> block{};
    size_t c{};
  };

  /**
   * @brief Get keccak-256 hash
   * @param to_hash - data to hash
   * @return hash
   */
  Hash256 keccak256(BytesIn to_hash);
}  // namespace paychan::crypto::keccak
