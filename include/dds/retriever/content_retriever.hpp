/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <vector>

#include <dds/retriever/retriever.hpp>

namespace dds::retriever {

  /**
   * Resolves a manifest id to the original content through a single
   * retriever. Content is returned only after it has been verified
   */
  class ContentRetriever {
   public:
    explicit ContentRetriever(std::shared_ptr<Retriever> retriever);

    /**
     * Fetch manifest and chunks without verifying them
     * @return manifest and its chunks in manifest order, or the first fetch
     * error
     */
    outcome::result<std::pair<Manifest, std::vector<Chunk>>> fetchParts(
        const ContentHash &manifest_id);

    /**
     * Fetch, verify and reassemble
     * @return content, the fetch error, or ServiceError::INTEGRITY_ERROR /
     * ServiceError::SIZE_MISMATCH for data which does not match the manifest
     */
    outcome::result<Bytes> retrieveContent(const ContentHash &manifest_id);

   private:
    std::shared_ptr<Retriever> retriever_;
  };

}  // namespace dds::retriever
