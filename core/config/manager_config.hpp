/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string>

#include <boost/optional.hpp>

#include "crypto/secp256k1/secp256k1_types.hpp"
#include "primitives/address/address.hpp"
#include "primitives/types.hpp"
#include "primitives/units.hpp"

namespace paychan::config {
  using crypto::secp256k1::PrivateKey;
  using primitives::TokenAmount;
  using primitives::address::Address;

  enum class ConfigError {
    kInvalidOption = 1,
    kCannotOpenConfigFile,
    kInvalidPrivateKey,
    kInvalidAddress,
    kInvalidAmount,
    kInvalidLogLevel,
  };

  /// Channel session run by paychan_cli
  struct SessionConfig {
    /// Random recipient if none
    boost::optional<Address> recipient;
    TokenAmount deposit;
    TokenAmount amount;
    uint64_t payments{10};
    /// Items of one batch payment after single payments, 0 for no batch
    uint64_t batch{0};
    boost::optional<TokenAmount> topup_threshold;
    boost::optional<TokenAmount> topup_amount;
    boost::optional<uint64_t> max_topups;
  };

  struct ManagerConfig {
    /// Random key if none
    boost::optional<PrivateKey> private_key;
    std::chrono::seconds default_duration{86400};
    boost::optional<TokenAmount> auto_settle_threshold;
    std::chrono::milliseconds ledger_timeout{std::chrono::seconds{30}};
    std::chrono::seconds challenge_period{3600};
    uint32_t decimals{primitives::kDefaultDecimals};
    /// One of e, w, i, d, t
    char log_level{'i'};
    boost::optional<std::string> log_file;
    SessionConfig session;
  };

  /**
   * Reads options from command line and optional config file given with
   * --config, command line wins.
   * @return none if help was requested and printed
   */
  outcome::result<boost::optional<ManagerConfig>> parseManagerConfig(
      int argc, const char *const *argv);
}  // namespace paychan::config

OUTCOME_HPP_DECLARE_ERROR(paychan::config, ConfigError);
