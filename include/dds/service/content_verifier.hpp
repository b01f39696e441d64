/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <dds/chunking/chunk.hpp>
#include <dds/service/error.hpp>

namespace dds::service {

  /**
   * Check a manifest and its chunks against their addresses and reassemble
   * the content.
   * @param chunks - in manifest order
   * @return original content; ServiceError::INTEGRITY_ERROR if the manifest
   * id, a chunk id or the content id does not match the data,
   * ServiceError::SIZE_MISMATCH if sizes disagree with the manifest
   */
  outcome::result<Bytes> verifyContent(
      const chunking::Manifest &manifest,
      const std::vector<chunking::Chunk> &chunks);

}  // namespace dds::service
