/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "channels/channel.hpp"

namespace paychan::channels {
  std::string stateToString(ChannelState state) {
    switch (state) {
      case ChannelState::kPending:
        return "pending";
      case ChannelState::kOpen:
        return "open";
      case ChannelState::kClosing:
        return "closing";
      case ChannelState::kClosed:
        return "closed";
      case ChannelState::kDisputed:
        return "disputed";
    }
    return "unknown";
  }
}  // namespace paychan::channels
