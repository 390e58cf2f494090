/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/time.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <spdlog/fmt/fmt.h>

OUTCOME_CPP_DEFINE_CATEGORY(paychan::clock, TimeFromStringError, e) {
  using paychan::clock::TimeFromStringError;
  if (e == TimeFromStringError::kInvalidFormat) {
    return "Input has invalid format";
  }
  return "Unknown error";
}

namespace paychan::clock {
  const static boost::posix_time::ptime kPtimeUnixZero(
      boost::gregorian::date(1970, 1, 1));

  std::string timestampToString(Timestamp time) {
    const auto count{time.count()};
    auto seconds{count / 1000};
    auto millis{count % 1000};
    if (millis < 0) {
      millis += 1000;
      --seconds;
    }
    return fmt::format(
        "{}.{:03}Z",
        boost::posix_time::to_iso_extended_string(
            kPtimeUnixZero + boost::posix_time::seconds{seconds}),
        millis);
  }

  outcome::result<Timestamp> timestampFromString(const std::string &str) {
    // "YYYY-MM-DDTHH:MM:SS.mmmZ"
    if (str.size() != 24 || str[19] != '.' || str[str.size() - 1] != 'Z') {
      return TimeFromStringError::kInvalidFormat;
    }
    boost::posix_time::ptime ptime;
    try {
      ptime = boost::posix_time::from_iso_extended_string(str.substr(0, 19));
    } catch (const std::exception &e) {
      return TimeFromStringError::kInvalidFormat;
    }
    if (ptime.is_special()) {
      return TimeFromStringError::kInvalidFormat;
    }
    int64_t millis{0};
    for (size_t i{20}; i < 23; ++i) {
      if (str[i] < '0' || str[i] > '9') {
        return TimeFromStringError::kInvalidFormat;
      }
      millis = millis * 10 + (str[i] - '0');
    }
    return Timestamp{(ptime - kPtimeUnixZero).total_seconds() * 1000 + millis};
  }
}  // namespace paychan::clock
