/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/chunking/fixed_size_chunker.hpp>

#include <algorithm>

#include <dds/chunking/error.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(dds::chunking, ChunkerError, e) {
  using dds::chunking::ChunkerError;
  switch (e) {
    case ChunkerError::EMPTY_CONTENT:
      return "content cannot be empty";
    case ChunkerError::NO_CHUNKS:
      return "cannot generate manifest for zero chunks";
  }
  return "unknown chunker error";
}

namespace dds::chunking {

  FixedSizeChunker::FixedSizeChunker(size_t chunk_size)
      : chunk_size_{chunk_size == 0 ? kDefaultChunkSize : chunk_size} {}

  outcome::result<std::vector<Chunk>> FixedSizeChunker::chunkContent(
      BytesIn content) const {
    if (content.empty()) {
      return ChunkerError::EMPTY_CONTENT;
    }

    std::vector<Chunk> chunks;
    chunks.reserve((content.size() + chunk_size_ - 1) / chunk_size_);
    for (size_t offset = 0; offset < content.size(); offset += chunk_size_) {
      auto size = std::min(chunk_size_, content.size() - offset);
      auto piece = content.subspan(offset, size);
      OUTCOME_TRY(id, ContentHash::compute(piece));
      chunks.push_back(
          Chunk{std::move(id), Bytes{piece.begin(), piece.end()}, size});
    }
    return chunks;
  }

  outcome::result<Manifest> FixedSizeChunker::generateManifest(
      const std::vector<Chunk> &chunks, BytesIn original_content) const {
    if (chunks.empty()) {
      return ChunkerError::NO_CHUNKS;
    }

    std::vector<ContentHash> chunk_ids;
    chunk_ids.reserve(chunks.size());
    uint64_t total_size = 0;
    for (const auto &chunk : chunks) {
      chunk_ids.push_back(chunk.id);
      total_size += chunk.size;
    }

    OUTCOME_TRY(content_id, ContentHash::compute(original_content));
    OUTCOME_TRY(id, computeManifestId(content_id, chunk_ids));

    return Manifest{std::move(id),
                    std::move(content_id),
                    std::move(chunk_ids),
                    total_size};
  }

  size_t FixedSizeChunker::chunkSize() const {
    return chunk_size_;
  }

}  // namespace dds::chunking
