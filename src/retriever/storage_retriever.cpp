/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/retriever/storage_retriever.hpp>

#include <boost/assert.hpp>

namespace dds::retriever {

  StorageRetriever::StorageRetriever(std::shared_ptr<storage::Storage> storage)
      : storage_{std::move(storage)} {
    BOOST_ASSERT(storage_ != nullptr);
  }

  outcome::result<Manifest> StorageRetriever::fetchManifest(
      const ContentHash &id) {
    return storage_->getManifest(id);
  }

  outcome::result<Chunk> StorageRetriever::fetchChunk(const ContentHash &id) {
    return storage_->getChunk(id);
  }

}  // namespace dds::retriever
