/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "channels/x402_header.hpp"

#include "codec/json/coding.hpp"
#include "codec/json/json.hpp"
#include "common/hexutil.hpp"

namespace paychan::channels {
  using codec::json::AsString;
  using codec::json::Document;
  using codec::json::Get;
  using codec::json::JsonError;
  using codec::json::Set;
  using codec::json::Value;

  namespace {
    constexpr std::string_view kPrefix{"channel "};

    template <typename T>
    T valueOrRaise(outcome::result<T> &&result) {
      if (!result) {
        outcome::raise(result.error());
      }
      return std::move(result.value());
    }

    template <size_t N>
    BytesN<N> decodeHex(const Value &j) {
      return valueOrRaise(common::fromHexN<N>(AsString(j)));
    }

    Value encodePayment(const SignedPayment &payment,
                        uint32_t decimals,
                        rapidjson::MemoryPoolAllocator<> &allocator) {
      Value j{rapidjson::kObjectType};
      Set(j, "channelId", common::toHex0x(payment.channel_id), allocator);
      Set(j,
          "amount",
          primitives::formatUnits(payment.amount, decimals),
          allocator);
      Set(j, "nonce", uint64_t{payment.nonce}, allocator);
      Set(j, "signature", common::toHex0x(payment.signature), allocator);
      Set(j, "timestamp", clock::timestampToString(payment.timestamp), allocator);
      return j;
    }

    SignedPayment decodePayment(const Value &j, uint32_t decimals) {
      SignedPayment payment;
      payment.channel_id = decodeHex<32>(Get(j, "channelId"));
      payment.amount = valueOrRaise(
          primitives::parseUnits(AsString(Get(j, "amount")), decimals));
      if (payment.amount < 0) {
        outcome::raise(JsonError::kWrongValue);
      }
      Get(j, "nonce", payment.nonce);
      payment.signature =
          decodeHex<crypto::signer::kSignatureLength>(Get(j, "signature"));
      payment.timestamp = valueOrRaise(
          clock::timestampFromString(AsString(Get(j, "timestamp"))));
      return payment;
    }
  }  // namespace

  outcome::result<std::string> encodeX402Header(
      const X402ChannelHeader &header, uint32_t decimals) {
    Document doc{rapidjson::kObjectType};
    auto &allocator{doc.GetAllocator()};
    Set(doc, "scheme", header.scheme, allocator);
    Set(doc, "channelId", common::toHex0x(header.channel_id), allocator);
    auto payment{encodePayment(header.payment, decimals, allocator)};
    doc.AddMember("payment", payment, allocator);
    OUTCOME_TRY(json, codec::json::format(doc));
    return std::string{kPrefix}
           + codec::json::encodeBase64(BytesIn(
               reinterpret_cast<const uint8_t *>(json.data()), json.size()));
  }

  outcome::result<X402ChannelHeader> decodeX402Header(std::string_view value,
                                                      uint32_t decimals) {
    if (value.substr(0, kPrefix.size()) != kPrefix) {
      return JsonError::kWrongValue;
    }
    OUTCOME_TRY(bytes,
                codec::json::decodeBase64(value.substr(kPrefix.size())));
    OUTCOME_TRY(doc,
                codec::json::parse(std::string_view{
                    reinterpret_cast<const char *>(bytes.data()),
                    bytes.size()}));
    try {
      X402ChannelHeader header;
      header.scheme = AsString(Get(doc, "scheme"));
      if (header.scheme != kX402Scheme) {
        return JsonError::kWrongValue;
      }
      header.channel_id = decodeHex<32>(Get(doc, "channelId"));
      header.payment = decodePayment(Get(doc, "payment"), decimals);
      return header;
    } catch (const std::system_error &e) {
      return outcome::failure(e.code());
    }
  }
}  // namespace paychan::channels
