/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "channels/statistics.hpp"

#include <cmath>

namespace paychan::channels {
  using std::chrono::duration_cast;
  using std::chrono::seconds;

  ExtendedChannelStats channelStats(const ChannelRecord &record,
                                    Timestamp now) {
    ExtendedChannelStats stats;
    const auto &history{record.history};
    stats.total_payments = history.size();
    stats.topup_count = record.topup_count;
    if (!history.empty()) {
      stats.largest_payment = history.front().amount;
      stats.smallest_payment = history.front().amount;
      for (const auto &payment : history) {
        stats.total_volume += payment.amount;
        if (payment.amount > stats.largest_payment) {
          stats.largest_payment = payment.amount;
        }
        if (payment.amount < stats.smallest_payment) {
          stats.smallest_payment = payment.amount;
        }
      }
      stats.average_payment = stats.total_volume / history.size();
    }

    auto age{now - record.channel.created_at};
    if (age.count() > 0) {
      stats.channel_age = duration_cast<seconds>(age).count();
      auto hours{static_cast<double>(age.count()) / 3600000.0};
      stats.payments_per_hour =
          std::round(static_cast<double>(history.size()) / hours * 100) / 100;
    }
    return stats;
  }

  ChannelStats aggregateStats(const std::vector<Channel> &channels) {
    ChannelStats stats;
    stats.total_channels = channels.size();
    for (const auto &channel : channels) {
      stats.total_deposited += channel.deposit;
      stats.total_spent += channel.spent;
      if (channel.state == ChannelState::kOpen) {
        ++stats.open_channels;
      }
      if (channel.state == ChannelState::kClosed) {
        stats.total_refunded += channel.balance;
      }
    }
    return stats;
  }
}  // namespace paychan::channels
