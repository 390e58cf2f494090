/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "channels/channel.hpp"

namespace paychan::channels {
  /**
   * Per channel payment metrics, zeros for empty history.
   * @param record - channel with its history and top-up counter
   * @param now - time to measure channel age at
   */
  ExtendedChannelStats channelStats(const ChannelRecord &record, Timestamp now);

  /// Totals over all channels
  ChannelStats aggregateStats(const std::vector<Channel> &channels);
}  // namespace paychan::channels
