/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace ps::common {
  using Logger = std::shared_ptr<spdlog::logger>;

  /**
   * Provide logger object
   * @param tag - tagging name for identifying logger
   * @return logger object
   */
  Logger createLogger(const std::string &tag);

  /**
   * Parse log level letter used by command line tools
   * @param level - one of e, w, i, d, t
   * @return spdlog level, info for unknown letters
   */
  spdlog::level::level_enum logLevelFromChar(char level);
}  // namespace ps::common
