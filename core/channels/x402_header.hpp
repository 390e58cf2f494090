/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "channels/channel.hpp"
#include "primitives/units.hpp"

namespace paychan::channels {
  constexpr std::string_view kX402Scheme{"channel"};

  /**
   * HTTP payment header carrying latest signed state of channel.
   * Value is "channel " + base64(json), amounts in json are decimal token
   * strings, signature and ids are 0x-hex.
   * Receiver must verify the payment, header fields are not trusted.
   */
  struct X402ChannelHeader {
    std::string scheme{kX402Scheme};
    ChannelId channel_id{};
    SignedPayment payment;
  };

  outcome::result<std::string> encodeX402Header(
      const X402ChannelHeader &header,
      uint32_t decimals = primitives::kDefaultDecimals);

  outcome::result<X402ChannelHeader> decodeX402Header(
      std::string_view value, uint32_t decimals = primitives::kDefaultDecimals);
}  // namespace paychan::channels
