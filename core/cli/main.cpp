/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <fmt/format.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <cstdlib>
#include <iostream>

#include "clock/impl/utc_clock_impl.hpp"
#include "common/hexutil.hpp"
#include "common/logger.hpp"
#include "config/manager_config.hpp"
#include "crypto/secp256k1/impl/secp256k1_provider_impl.hpp"
#include "crypto/signer/impl/eth_signer.hpp"
#include "ledger/impl/in_memory_ledger.hpp"
#include "payment_channel_manager/impl/payment_channel_manager_impl.hpp"

namespace paychan {
  using channels::AutoTopupConfig;
  using channels::BatchPaymentItem;
  using channels::CreateChannelParams;
  using common::toHex0x;
  using config::ManagerConfig;
  using crypto::secp256k1::PrivateKey;
  using crypto::secp256k1::Secp256k1ProviderImpl;
  using crypto::signer::EthSigner;
  using ledger::InMemoryLedger;
  using payment_channel_manager::PaymentChannelManagerImpl;
  using primitives::formatUnits;
  using primitives::TokenAmount;

  namespace {
    auto &log() {
      static auto log{common::createLogger("paychan")};
      return log;
    }

    /// Opens channel, pays through it, settles it and prints balances
    outcome::result<void> runSession(const ManagerConfig &config) {
      const auto &session{config.session};
      auto secp256k1{std::make_shared<Secp256k1ProviderImpl>()};
      auto signer{std::make_shared<EthSigner>(secp256k1)};
      auto clock{std::make_shared<clock::UTCClockImpl>()};
      auto ledger{std::make_shared<InMemoryLedger>(
          signer, clock, config.challenge_period)};

      PrivateKey sender_key{};
      if (config.private_key) {
        sender_key = *config.private_key;
      } else {
        OUTCOME_TRY(key_pair, secp256k1->generate());
        sender_key = key_pair.private_key;
      }
      OUTCOME_TRY(sender,
                  PaymentChannelManagerImpl::create(
                      ledger, signer, clock, sender_key, config));

      // recipient manager is only available when its key is known
      std::shared_ptr<PaymentChannelManagerImpl> recipient;
      auto recipient_address{session.recipient};
      if (!recipient_address) {
        OUTCOME_TRY(key_pair, secp256k1->generate());
        OUTCOME_TRYA(recipient,
                     PaymentChannelManagerImpl::create(
                         ledger, signer, clock, key_pair.private_key, config));
        recipient_address = recipient->address();
      }

      CreateChannelParams params;
      params.recipient = *recipient_address;
      params.deposit = session.deposit;
      if (session.topup_threshold && session.topup_amount) {
        params.auto_topup = AutoTopupConfig{*session.topup_threshold,
                                            *session.topup_amount,
                                            session.max_topups};
      }
      TokenAmount funds{session.deposit};
      if (params.auto_topup) {
        funds += *session.topup_amount
                 * session.max_topups.value_or(session.payments + 1);
      }
      ledger->fund(sender->address(), funds);

      fmt::print("sender    {}\nrecipient {}\n",
                 sender->address().toString(),
                 recipient_address->toString());

      OUTCOME_TRY(channel, sender->createChannel(params));
      fmt::print("channel   {} deposit {}\n",
                 toHex0x(channel.id),
                 formatUnits(channel.deposit, config.decimals));
      if (recipient) {
        OUTCOME_TRY(recipient->trackChannel(channel));
      }

      for (uint64_t i{0}; i < session.payments; ++i) {
        if (recipient) {
          OUTCOME_TRY(header,
                      sender->createX402Header(channel.id, session.amount));
          OUTCOME_TRY(receipt,
                      recipient->acceptX402Header(header, sender->address()));
          log()->debug("{} accepted, +{}",
                       receipt.receipt_id,
                       formatUnits(receipt.amount, config.decimals));
        } else {
          OUTCOME_TRY(payment, sender->pay(channel.id, session.amount));
          log()->debug("payment {} total {}",
                       payment.nonce,
                       formatUnits(payment.amount, config.decimals));
        }
      }

      if (session.batch != 0) {
        std::vector<BatchPaymentItem> items;
        for (uint64_t i{0}; i < session.batch; ++i) {
          items.push_back({session.amount, fmt::format("item {}", i + 1)});
        }
        OUTCOME_TRY(batch, sender->batchPay(channel.id, items));
        fmt::print("batch     {} payments, {} total, nonce {}\n",
                   batch.count,
                   formatUnits(batch.total_amount, config.decimals),
                   batch.payment.nonce);
        if (recipient) {
          OUTCOME_TRY(recipient->acceptPayment(batch.payment,
                                               sender->address()));
        }
      }

      OUTCOME_TRY(stats, sender->getChannelStats(channel.id));
      fmt::print("payments  {} volume {} average {} top-ups {}\n",
                 stats.total_payments,
                 formatUnits(stats.total_volume, config.decimals),
                 formatUnits(stats.average_payment, config.decimals),
                 stats.topup_count);

      OUTCOME_TRY(settlement, sender->closeChannel(channel.id));
      fmt::print("settled   tx {} recipient +{} refund {}\n",
                 toHex0x(settlement.tx_hash),
                 formatUnits(settlement.final_amount, config.decimals),
                 formatUnits(settlement.refund_amount, config.decimals));
      fmt::print("balances  sender {} recipient {}\n",
                 formatUnits(ledger->balanceOf(sender->address()),
                             config.decimals),
                 formatUnits(ledger->balanceOf(*recipient_address),
                             config.decimals));
      return outcome::success();
    }
  }  // namespace
}  // namespace paychan

int main(int argc, char *argv[]) {
  auto config{paychan::config::parseManagerConfig(argc, argv)};
  if (!config) {
    std::cerr << config.error().message() << std::endl;
    return EXIT_FAILURE;
  }
  if (!config.value()) {
    return EXIT_SUCCESS;
  }
  spdlog::set_level(
      paychan::common::logLevelFromChar(config.value()->log_level));
  if (const auto &path{config.value()->log_file}; path) {
    try {
      paychan::common::file_sink =
          std::make_shared<spdlog::sinks::basic_file_sink_mt>(*path);
    } catch (const spdlog::spdlog_ex &e) {
      std::cerr << "Cannot open log file " << *path << ": " << e.what()
                << std::endl;
      return EXIT_FAILURE;
    }
    spdlog::default_logger()->sinks().push_back(paychan::common::file_sink);
  }

  auto result{paychan::runSession(*config.value())};
  if (!result) {
    spdlog::error("session failed: {}", result.error().message());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
