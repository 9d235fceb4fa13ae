/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace {
  constexpr auto kPattern{"%Y-%m-%d %H:%M:%S.%e [%n] %^%l%$ %v"};

  void setGlobalPattern(spdlog::logger &logger) {
    logger.set_pattern(kPattern);
  }
}  // namespace

namespace rc::common {
  Logger createLogger(const std::string &tag) {
    auto logger = spdlog::get(tag);
    if (logger == nullptr) {
      logger = spdlog::stdout_color_mt(tag);
      setGlobalPattern(*logger);
    }
    return logger;
  }

  void setLogLevel(spdlog::level::level_enum level) {
    spdlog::set_level(level);
  }
}  // namespace rc::common
