/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <dds/chunking/chunker.hpp>

namespace dds::chunking {

  /**
   * Cuts content into pieces of the same size; the last piece may be
   * shorter
   */
  class FixedSizeChunker : public Chunker {
   public:
    static constexpr size_t kDefaultChunkSize = 1024;

    /// @param chunk_size - zero selects kDefaultChunkSize
    explicit FixedSizeChunker(size_t chunk_size = kDefaultChunkSize);

    ~FixedSizeChunker() override = default;

    outcome::result<std::vector<Chunk>> chunkContent(
        BytesIn content) const override;

    outcome::result<Manifest> generateManifest(
        const std::vector<Chunk> &chunks,
        BytesIn original_content) const override;

    size_t chunkSize() const;

   private:
    size_t chunk_size_;
  };

}  // namespace dds::chunking
