/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/log/logger.hpp>

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace {
  void setDebugPattern(spdlog::logger &logger) {
    logger.set_pattern("[%Y-%m-%d %H:%M:%S.%F][th:%t][%l] %n %v");
  }

  std::shared_ptr<spdlog::logger> makeLogger(const std::string &tag) {
    auto logger = spdlog::stdout_color_mt(tag);
    setDebugPattern(*logger);
    return logger;
  }
}  // namespace

namespace dds::log {
  Logger createLogger(const std::string &tag) {
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    auto logger = spdlog::get(tag);
    if (logger == nullptr) {  // NOLINT
      logger = makeLogger(tag);
    }
    return logger;
  }

  void setLevel(Level level) {
    spdlog::set_level(level);
  }
}  // namespace dds::log
