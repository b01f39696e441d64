/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <dds/chunking/chunk.hpp>

namespace dds::retriever {

  using chunking::Chunk;
  using chunking::Manifest;
  using content::ContentHash;

  /**
   * Resolves addresses to manifests and chunks, wherever they are kept.
   * Results are not verified
   */
  class Retriever {
   public:
    virtual ~Retriever() = default;

    virtual outcome::result<Manifest> fetchManifest(const ContentHash &id) = 0;

    virtual outcome::result<Chunk> fetchChunk(const ContentHash &id) = 0;
  };

}  // namespace dds::retriever
