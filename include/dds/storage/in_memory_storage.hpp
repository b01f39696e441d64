/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <shared_mutex>
#include <unordered_map>

#include <dds/storage/storage.hpp>

namespace dds::storage {

  class InMemoryStorage : public Storage {
   public:
    InMemoryStorage() = default;
    ~InMemoryStorage() override = default;

    outcome::result<void> storeChunk(const Chunk &chunk) override;

    outcome::result<Chunk> getChunk(const ContentHash &id) const override;

    outcome::result<void> storeManifest(const Manifest &manifest) override;

    outcome::result<Manifest> getManifest(const ContentHash &id) const override;

    size_t chunkCount() const;

    size_t manifestCount() const;

   private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<ContentHash, Chunk> chunks_;
    std::unordered_map<ContentHash, Manifest> manifests_;
  };

}  // namespace dds::storage
