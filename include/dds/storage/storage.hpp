/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <dds/chunking/chunk.hpp>
#include <dds/storage/error.hpp>

namespace dds::storage {

  using chunking::Chunk;
  using chunking::Manifest;
  using content::ContentHash;

  /**
   * Local persistence of chunks and manifests, keyed by their addresses.
   * Writes are trusted: ids are not checked against the data. Storing an
   * already present id replaces the previous record
   */
  class Storage {
   public:
    virtual ~Storage() = default;

    virtual outcome::result<void> storeChunk(const Chunk &chunk) = 0;

    /// @return chunk or StorageError::CHUNK_NOT_FOUND
    virtual outcome::result<Chunk> getChunk(const ContentHash &id) const = 0;

    virtual outcome::result<void> storeManifest(const Manifest &manifest) = 0;

    /// @return manifest or StorageError::MANIFEST_NOT_FOUND
    virtual outcome::result<Manifest> getManifest(
        const ContentHash &id) const = 0;
  };

}  // namespace dds::storage
