/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace paychan::common {
  spdlog::sink_ptr file_sink;

  namespace {
    spdlog::sink_ptr &consoleSink() {
      static spdlog::sink_ptr sink{
          std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
      return sink;
    }
  }  // namespace

  Logger createLogger(const std::string &tag) {
    static std::mutex mutex;
    std::lock_guard lock{mutex};
    if (auto logger{spdlog::get(tag)}) {
      return logger;
    }
    std::vector<spdlog::sink_ptr> sinks{consoleSink()};
    if (file_sink) {
      sinks.push_back(file_sink);
    }
    auto logger{
        std::make_shared<spdlog::logger>(tag, sinks.begin(), sinks.end())};
    logger->set_level(spdlog::get_level());
    spdlog::register_logger(logger);
    return logger;
  }

  spdlog::level::level_enum logLevelFromChar(char level) {
    switch (level) {
      case 'e':
        return spdlog::level::err;
      case 'w':
        return spdlog::level::warn;
      case 'd':
        return spdlog::level::debug;
      case 't':
        return spdlog::level::trace;
      default:
        return spdlog::level::info;
    }
  }
}  // namespace paychan::common
