/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <dds/chunking/chunk.hpp>

namespace dds::chunking {

  /**
   * Splits content into addressed chunks and describes them with a manifest
   */
  class Chunker {
   public:
    virtual ~Chunker() = default;

    /**
     * Split content into ordered chunks
     * @param content - bytes to split, must not be empty
     * @return chunks in content order
     */
    virtual outcome::result<std::vector<Chunk>> chunkContent(
        BytesIn content) const = 0;

    /**
     * Describe chunks previously produced from @param original_content
     * @param chunks - result of chunkContent(), must not be empty
     * @return manifest with a deterministic id
     */
    virtual outcome::result<Manifest> generateManifest(
        const std::vector<Chunk> &chunks, BytesIn original_content) const = 0;
  };

}  // namespace dds::chunking
