/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace dds::log {

  using Level = spdlog::level::level_enum;
  using Logger = std::shared_ptr<spdlog::logger>;

  /**
   * Provide logger object
   * @param tag - tagging name for identifying logger
   * @return logger object, shared between all callers using the same tag
   */
  [[nodiscard]] Logger createLogger(const std::string &tag);

  /// Sets level of every logger, existing and created later
  void setLevel(Level level);

}  // namespace dds::log
