/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <dds/content/content_hash.hpp>

namespace dds::chunking {

  using content::ContentHash;

  /// A slice of content, addressed by the hash of its data
  struct Chunk {
    ContentHash id;
    Bytes data;
    size_t size = 0;

    bool operator==(const Chunk &other) const = default;
  };

  /// Describes how to reassemble and verify a content from its chunks
  struct Manifest {
    /// hash(content_id || chunk_ids...), over the hex renderings
    ContentHash id;
    /// hash of the whole original content
    ContentHash content_id;
    /// reassembly order
    std::vector<ContentHash> chunk_ids;
    uint64_t total_size = 0;

    bool operator==(const Manifest &other) const = default;
  };

  /**
   * Derive the manifest address. The result depends on the order of
   * @param chunk_ids
   */
  outcome::result<ContentHash> computeManifestId(
      const ContentHash &content_id, const std::vector<ContentHash> &chunk_ids);

}  // namespace dds::chunking
