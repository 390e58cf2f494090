/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <spdlog/spdlog.h>

namespace paychan::common {
  using Logger = std::shared_ptr<spdlog::logger>;

  /// Extra sink attached to every logger created after it is set
  extern spdlog::sink_ptr file_sink;

  /**
   * Provide logger object
   * @param tag - tagging name for identifying logger
   * @return logger object
   */
  Logger createLogger(const std::string &tag);

  /**
   * Maps one-letter level used in configuration to spdlog level
   * @param level - one of 'e', 'w', 'i', 'd', 't'
   * @return spdlog level, info for unknown letters
   */
  spdlog::level::level_enum logLevelFromChar(char level);
}  // namespace paychan::common
