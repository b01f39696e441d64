/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <dds/common/types.hpp>

namespace dds::crypto::random {

  /// Entropy for node identifiers
  class RandomSource {
   public:
    virtual ~RandomSource() = default;

    /// Overwrite every byte of @param out
    virtual void fill(BytesOut out) = 0;
  };

}  // namespace dds::crypto::random
