/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <rapidjson/document.h>

#include <string>
#include <string_view>

#include "codec/json/json_errors.hpp"
#include "common/outcome.hpp"

#define JSON_ENCODE(type)                   \
  inline ::paychan::codec::json::Value encode( \
      const type &v, rapidjson::MemoryPoolAllocator<> &allocator)

// NOLINTNEXTLINE(bugprone-macro-parentheses)
#define JSON_DECODE(type) \
  inline void decode(type &v, const ::paychan::codec::json::Value &j)

namespace paychan::codec::json {
  using rapidjson::Document;
  using rapidjson::Value;

  inline std::string AsString(const Value &j) {
    if (!j.IsString()) {
      outcome::raise(JsonError::kWrongType);
    }
    return {j.GetString(), j.GetStringLength()};
  }

  JSON_ENCODE(uint64_t) {
    return Value{v};
  }

  JSON_DECODE(uint64_t) {
    if (!j.IsUint64()) {
      outcome::raise(JsonError::kWrongType);
    }
    v = j.GetUint64();
  }

  JSON_ENCODE(std::string_view) {
    return {v.data(), static_cast<rapidjson::SizeType>(v.size()), allocator};
  }

  JSON_ENCODE(std::string) {
    return encode(std::string_view{v}, allocator);
  }

  JSON_DECODE(std::string) {
    v = AsString(j);
  }

  template <typename T>
  inline void Set(Value &j,
                  std::string_view key,
                  const T &v,
                  rapidjson::MemoryPoolAllocator<> &allocator) {
    j.AddMember(encode(key, allocator), encode(v, allocator), allocator);
  }

  inline const Value &Get(const Value &j, const char *key) {
    if (!j.IsObject()) {
      outcome::raise(JsonError::kWrongType);
    }
    auto it = j.FindMember(key);
    if (it == j.MemberEnd()) {
      outcome::raise(JsonError::kOutOfRange);
    }
    return it->value;
  }

  template <typename T>
  inline void Get(const Value &j, const char *key, T &v) {
    decode(v, Get(j, key));
  }

  template <typename T>
  inline Document encode(const T &v) {
    Document document;
    static_cast<Value &>(document) = encode(v, document.GetAllocator());
    return document;
  }

  template <typename T>
  inline outcome::result<T> decode(const Value &j) {
    try {
      T v{};
      decode(v, j);
      return v;
    } catch (std::system_error &e) {
      return outcome::failure(e.code());
    }
  }
}  // namespace paychan::codec::json
