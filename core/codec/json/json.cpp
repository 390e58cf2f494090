/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/json/json.hpp"

#include <cppcodec/base64_rfc4648.hpp>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "codec/json/json_errors.hpp"

namespace paychan::codec::json {
  using rapidjson::StringBuffer;
  using base64 = cppcodec::base64_rfc4648;

  outcome::result<Document> parse(std::string_view input) {
    Document doc;
    doc.Parse(input.data(), input.size());
    if (doc.HasParseError()) {
      return JsonError::kParseError;
    }
    return std::move(doc);
  }

  outcome::result<std::string> format(const Document &doc) {
    StringBuffer buffer;
    rapidjson::Writer<StringBuffer> writer{buffer};
    if (!doc.Accept(writer)) {
      return JsonError::kWrongValue;
    }
    return std::string{buffer.GetString(), buffer.GetSize()};
  }

  std::string encodeBase64(BytesIn bytes) {
    return base64::encode(bytes.data(), bytes.size());
  }

  outcome::result<Bytes> decodeBase64(std::string_view str) {
    try {
      return base64::decode(str.data(), str.size());
    } catch (const cppcodec::parse_error &) {
      return JsonError::kParseError;
    }
  }
}  // namespace paychan::codec::json
