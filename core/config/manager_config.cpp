/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/manager_config.hpp"

#include <fstream>
#include <iostream>

#include <boost/program_options.hpp>

#include "common/hexutil.hpp"

namespace paychan::config {
  using primitives::parseUnits;

  namespace {
    constexpr std::string_view kLogLevels{"ewidt"};

    struct ConfigRaw {
      std::string private_key;
      uint64_t duration{86400};
      std::string auto_settle_threshold;
      uint64_t ledger_timeout_ms{30000};
      uint64_t challenge_period{3600};
      uint32_t decimals{primitives::kDefaultDecimals};
      char log_level{'i'};
      std::string log_file;
      std::string recipient;
      std::string deposit{"100"};
      std::string amount{"1"};
      uint64_t payments{10};
      uint64_t batch{0};
      std::string topup_threshold;
      std::string topup_amount;
      uint64_t max_topups{0};
    };

    outcome::result<bool> parseCommandLine(int argc,
                                           const char *const *argv,
                                           ConfigRaw &raw) {
      namespace po = boost::program_options;
      std::string config_file;

      po::options_description desc("Payment channel options");
      desc.add_options()("help,h", "print usage message")(
          "config,c", po::value(&config_file), "config file name")(
          "private-key,k",
          po::value(&raw.private_key),
          "sender private key hex, random if not set")(
          "duration",
          po::value(&raw.duration),
          "default channel duration, seconds")(
          "auto-settle-threshold",
          po::value(&raw.auto_settle_threshold),
          "balance to suggest settlement at")(
          "ledger-timeout",
          po::value(&raw.ledger_timeout_ms),
          "ledger call timeout, milliseconds")(
          "challenge-period",
          po::value(&raw.challenge_period),
          "dispute challenge period, seconds")(
          "decimals", po::value(&raw.decimals), "token decimals")(
          "log,l", po::value(&raw.log_level), "log level, [e,w,i,d,t]")(
          "log-file", po::value(&raw.log_file), "also write log to file")(
          "recipient,r",
          po::value(&raw.recipient),
          "channel recipient, random if not set")(
          "deposit,d", po::value(&raw.deposit), "channel deposit")(
          "amount,a", po::value(&raw.amount), "amount of every payment")(
          "payments,n", po::value(&raw.payments), "number of payments")(
          "batch,b", po::value(&raw.batch), "items in batch payment")(
          "topup-threshold",
          po::value(&raw.topup_threshold),
          "auto top-up threshold")(
          "topup-amount", po::value(&raw.topup_amount), "auto top-up amount")(
          "max-topups",
          po::value(&raw.max_topups),
          "auto top-up limit, 0 for unlimited");

      try {
        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("config") != 0) {
          config_file = vm["config"].as<std::string>();
          std::ifstream ifs(config_file.c_str());
          if (ifs.fail()) {
            std::cerr << "Cannot open config file " << config_file
                      << std::endl;
            return ConfigError::kCannotOpenConfigFile;
          }
          po::store(po::parse_config_file(ifs, desc), vm);
        }

        po::notify(vm);

        if (vm.count("help") != 0) {
          std::cerr << desc << "\n";
          return false;
        }
      } catch (const po::error &e) {
        std::cerr << e.what() << std::endl;
        return ConfigError::kInvalidOption;
      }
      return true;
    }

    outcome::result<TokenAmount> parseAmount(const std::string &str,
                                             uint32_t decimals) {
      auto amount{parseUnits(str, decimals)};
      if (!amount || amount.value() < 0) {
        std::cerr << "Invalid amount " << str << std::endl;
        return ConfigError::kInvalidAmount;
      }
      return amount;
    }

    outcome::result<boost::optional<TokenAmount>> parseOptionalAmount(
        const std::string &str, uint32_t decimals) {
      if (str.empty()) {
        return boost::optional<TokenAmount>{};
      }
      OUTCOME_TRY(amount, parseAmount(str, decimals));
      return boost::optional<TokenAmount>{amount};
    }

    outcome::result<ManagerConfig> applyRawConfig(const ConfigRaw &raw) {
      ManagerConfig config;
      if (!raw.private_key.empty()) {
        auto key{common::fromHexN<crypto::secp256k1::kPrivateKeyLength>(
            raw.private_key)};
        if (!key) {
          std::cerr << "Invalid private key" << std::endl;
          return ConfigError::kInvalidPrivateKey;
        }
        config.private_key = key.value();
      }
      if (kLogLevels.find(raw.log_level) == std::string_view::npos) {
        std::cerr << "Invalid log level " << raw.log_level << std::endl;
        return ConfigError::kInvalidLogLevel;
      }
      config.log_level = raw.log_level;
      if (!raw.log_file.empty()) {
        config.log_file = raw.log_file;
      }
      config.default_duration = std::chrono::seconds{raw.duration};
      config.ledger_timeout = std::chrono::milliseconds{raw.ledger_timeout_ms};
      config.challenge_period = std::chrono::seconds{raw.challenge_period};
      config.decimals = raw.decimals;
      OUTCOME_TRYA(config.auto_settle_threshold,
                   parseOptionalAmount(raw.auto_settle_threshold,
                                       raw.decimals));

      auto &session{config.session};
      if (!raw.recipient.empty()) {
        auto recipient{Address::fromString(raw.recipient)};
        if (!recipient) {
          std::cerr << "Invalid recipient " << raw.recipient << std::endl;
          return ConfigError::kInvalidAddress;
        }
        session.recipient = recipient.value();
      }
      OUTCOME_TRYA(session.deposit, parseAmount(raw.deposit, raw.decimals));
      OUTCOME_TRYA(session.amount, parseAmount(raw.amount, raw.decimals));
      session.payments = raw.payments;
      session.batch = raw.batch;
      OUTCOME_TRYA(session.topup_threshold,
                   parseOptionalAmount(raw.topup_threshold, raw.decimals));
      OUTCOME_TRYA(session.topup_amount,
                   parseOptionalAmount(raw.topup_amount, raw.decimals));
      if (raw.max_topups != 0) {
        session.max_topups = raw.max_topups;
      }
      return config;
    }
  }  // namespace

  outcome::result<boost::optional<ManagerConfig>> parseManagerConfig(
      int argc, const char *const *argv) {
    ConfigRaw raw;
    OUTCOME_TRY(proceed, parseCommandLine(argc, argv, raw));
    if (!proceed) {
      return boost::optional<ManagerConfig>{};
    }
    OUTCOME_TRY(config, applyRawConfig(raw));
    return boost::optional<ManagerConfig>{std::move(config)};
  }
}  // namespace paychan::config

OUTCOME_CPP_DEFINE_CATEGORY(paychan::config, ConfigError, e) {
  using E = paychan::config::ConfigError;
  switch (e) {
    case E::kInvalidOption:
      return "Config: invalid option";
    case E::kCannotOpenConfigFile:
      return "Config: cannot open config file";
    case E::kInvalidPrivateKey:
      return "Config: invalid private key";
    case E::kInvalidAddress:
      return "Config: invalid address";
    case E::kInvalidAmount:
      return "Config: invalid amount";
    case E::kInvalidLogLevel:
      return "Config: invalid log level";
  }
  return "Config: unknown error";
}
