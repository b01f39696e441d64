/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <dds/outcome/outcome.hpp>

namespace dds::chunking {

  enum class ChunkerError {
    EMPTY_CONTENT = 1,  ///< nothing to chunk
    NO_CHUNKS,          ///< manifest requested for an empty chunk list
  };

}  // namespace dds::chunking

OUTCOME_HPP_DECLARE_ERROR(dds::chunking, ChunkerError)
