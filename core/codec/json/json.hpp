/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <rapidjson/document.h>

#include <string>
#include <string_view>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace paychan::codec::json {
  using rapidjson::Document;

  outcome::result<Document> parse(std::string_view input);

  outcome::result<std::string> format(const Document &doc);

  /// RFC 4648 base64 with padding
  std::string encodeBase64(BytesIn bytes);
  outcome::result<Bytes> decodeBase64(std::string_view str);
}  // namespace paychan::codec::json
