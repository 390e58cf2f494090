/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/keccak/keccak.hpp"

#include <algorithm>

#include <ethash/keccak.hpp>

namespace paychan::crypto::keccak {
  void Ctx::update(BytesIn in) {
    for (const auto byte : in) {
      block[c++] = byte;
      if (c == block.size()) {
        _absorb();
        c = 0;
      }
    }
  }

  void Ctx::_absorb() {
    for (size_t i{0}; i < block.size() / 8; ++i) {
      uint64_t lane{0};
      for (auto k{0}; k < 8; ++k) {
        lane |= static_cast<uint64_t>(block[8 * i + k]) << (8 * k);
      }
      state[i] ^= lane;
    }
    ethash_keccakf1600(state.data());
  }

  Hash256 Ctx::final() {
    std::fill(block.begin() + c, block.end(), 0);
    block[c] ^= 0x01;
    block[block.size() - 1] ^= 0x80;
    _absorb();
    Hash256 hash{};
    for (size_t i{0}; i < hash.size(); ++i) {
      hash[i] = static_cast<uint8_t>(state[i / 8] >> (8 * (i % 8)));
    }
    return hash;
  }

  Hash256 keccak256(BytesIn to_hash) {
    const auto digest{ethash::keccak256(to_hash.data(), to_hash.size())};
    Hash256 hash{};
    std::copy(std::begin(digest.bytes), std::end(digest.bytes), hash.begin());
    return hash;
  }
}  // namespace paychan::crypto::keccak
