/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace dds {

  using Bytes = std::vector<uint8_t>;

  /// read-only view of bytes owned elsewhere
  using BytesIn = std::span<const uint8_t>;

  using BytesOut = std::span<uint8_t>;

}  // namespace dds

namespace dds::common {

  constexpr size_t kHash256Size = 32;

  /// raw SHA-256 digest
  using Hash256 = std::array<uint8_t, kHash256Size>;

}  // namespace dds::common
