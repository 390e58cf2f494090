/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "channels/auto_topup_engine.hpp"

#include "common/hexutil.hpp"
#include "common/logger.hpp"
#include "ledger/call_blocking.hpp"
#include "primitives/units.hpp"

namespace paychan::channels {
  using common::toHex0x;
  using primitives::formatUnits;

  inline auto &log() {
    static auto log{common::createLogger("AutoTopup")};
    return log;
  }

  namespace {
    struct Reservation {
      boost::optional<TokenAmount> amount;
      bool limit_reached{false};
    };
  }  // namespace

  AutoTopupEngine::AutoTopupEngine(std::shared_ptr<ChannelStore> store,
                                   std::shared_ptr<ledger::Ledger> ledger,
                                   std::chrono::milliseconds ledger_timeout)
      : store_{std::move(store)},
        ledger_{std::move(ledger)},
        ledger_timeout_{ledger_timeout} {}

  bool AutoTopupEngine::check(const ChannelId &id) {
    auto reservation{store_->update(
        id, [](ChannelRecord &record) -> outcome::result<Reservation> {
          Reservation reservation;
          if (!record.auto_topup
              || record.channel.state != ChannelState::kOpen) {
            return reservation;
          }
          const auto &config{*record.auto_topup};
          if (record.channel.balance > config.threshold) {
            return reservation;
          }
          if (config.max_topups
              && record.auto_topups + record.reserved_topups
                     >= *config.max_topups) {
            reservation.limit_reached = true;
            return reservation;
          }
          ++record.reserved_topups;
          reservation.amount = config.amount;
          return reservation;
        })};
    if (!reservation) {
      log()->warn("auto top-up check of {} failed: {}",
                  toHex0x(id),
                  reservation.error().message());
      return false;
    }
    if (reservation.value().limit_reached) {
      log()->info("auto top-up limit reached for channel {}", toHex0x(id));
      return false;
    }
    if (!reservation.value().amount) {
      return false;
    }
    auto amount{*reservation.value().amount};

    auto receipt{ledger::callBlocking(
        *ledger_, ledger::TopUpChannel{id, amount}, ledger_timeout_)};

    auto committed{
        store_->update(id, [&](ChannelRecord &record) -> outcome::result<void> {
          --record.reserved_topups;
          if (receipt) {
            record.channel.deposit += amount;
            record.channel.balance += amount;
            ++record.auto_topups;
            ++record.topup_count;
          }
          return outcome::success();
        })};
    if (!committed) {
      log()->error("auto top-up of {} lost: {}",
                   toHex0x(id),
                   committed.error().message());
      return false;
    }
    if (!receipt) {
      log()->error("auto top-up of {} failed: {}",
                   toHex0x(id),
                   receipt.error().message());
      return false;
    }
    log()->info("auto top-up performed: {} to channel {}",
                formatUnits(amount),
                toHex0x(id));
    return true;
  }

  outcome::result<void> AutoTopupEngine::updateAutoTopup(
      const ChannelId &id, const AutoTopupConfig &config) {
    if (config.amount <= 0 || config.threshold < 0) {
      return ChannelError::kInvalidAmount;
    }
    return store_->update(id,
                          [&](ChannelRecord &record) -> outcome::result<void> {
      record.auto_topup = config;
      return outcome::success();
    });
  }

  outcome::result<void> AutoTopupEngine::disableAutoTopup(
      const ChannelId &id) {
    return store_->update(id,
                          [](ChannelRecord &record) -> outcome::result<void> {
      record.auto_topup.reset();
      return outcome::success();
    });
  }

  outcome::result<AutoTopupStatus> AutoTopupEngine::getAutoTopupStatus(
      const ChannelId &id) const {
    OUTCOME_TRY(record, store_->getRecord(id));
    AutoTopupStatus status;
    status.total_topups = record.auto_topups;
    if (!record.auto_topup) {
      status.threshold = 0;
      status.topup_amount = 0;
      status.topups_remaining = uint64_t{0};
      return status;
    }
    const auto &config{*record.auto_topup};
    status.enabled = true;
    status.threshold = config.threshold;
    status.topup_amount = config.amount;
    if (config.max_topups) {
      status.topups_remaining = *config.max_topups > record.auto_topups
                                    ? *config.max_topups - record.auto_topups
                                    : uint64_t{0};
    }
    return status;
  }
}  // namespace paychan::channels
