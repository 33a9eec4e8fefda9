/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace ps::common {
  namespace {
    constexpr auto kPattern{"%Y-%m-%d %H:%M:%S.%e %^%L%$ [%n] %v"};

    spdlog::sink_ptr consoleSink() {
      static auto sink{std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
      return sink;
    }
  }  // namespace

  Logger createLogger(const std::string &tag) {
    static std::mutex mutex;
    std::lock_guard lock{mutex};
    auto logger{spdlog::get(tag)};
    if (logger == nullptr) {
      logger = std::make_shared<spdlog::logger>(tag, consoleSink());
      logger->set_pattern(kPattern);
      logger->set_level(spdlog::get_level());
      spdlog::register_logger(logger);
    }
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
    }
    return spdlog::level::info;
  }
}  // namespace ps::common
