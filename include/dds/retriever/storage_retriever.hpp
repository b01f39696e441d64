/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <dds/retriever/retriever.hpp>
#include <dds/storage/storage.hpp>

namespace dds::retriever {

  /// Reads from local storage
  class StorageRetriever : public Retriever {
   public:
    explicit StorageRetriever(std::shared_ptr<storage::Storage> storage);

    outcome::result<Manifest> fetchManifest(const ContentHash &id) override;

    outcome::result<Chunk> fetchChunk(const ContentHash &id) override;

   private:
    std::shared_ptr<storage::Storage> storage_;
  };

}  // namespace dds::retriever
