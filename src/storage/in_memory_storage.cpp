/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/storage/in_memory_storage.hpp>

#include <mutex>

namespace dds::storage {

  outcome::result<void> InMemoryStorage::storeChunk(const Chunk &chunk) {
    std::unique_lock lock(mutex_);
    chunks_.insert_or_assign(chunk.id, chunk);
    return outcome::success();
  }

  outcome::result<Chunk> InMemoryStorage::getChunk(
      const ContentHash &id) const {
    std::shared_lock lock(mutex_);
    if (auto it = chunks_.find(id); it != chunks_.end()) {
      return it->second;
    }
    return StorageError::CHUNK_NOT_FOUND;
  }

  outcome::result<void> InMemoryStorage::storeManifest(
      const Manifest &manifest) {
    std::unique_lock lock(mutex_);
    manifests_.insert_or_assign(manifest.id, manifest);
    return outcome::success();
  }

  outcome::result<Manifest> InMemoryStorage::getManifest(
      const ContentHash &id) const {
    std::shared_lock lock(mutex_);
    if (auto it = manifests_.find(id); it != manifests_.end()) {
      return it->second;
    }
    return StorageError::MANIFEST_NOT_FOUND;
  }

  size_t InMemoryStorage::chunkCount() const {
    std::shared_lock lock(mutex_);
    return chunks_.size();
  }

  size_t InMemoryStorage::manifestCount() const {
    std::shared_lock lock(mutex_);
    return manifests_.size();
  }

}  // namespace dds::storage
