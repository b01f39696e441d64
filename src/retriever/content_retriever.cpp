/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/retriever/content_retriever.hpp>

#include <boost/assert.hpp>

#include <dds/service/content_verifier.hpp>

namespace dds::retriever {

  ContentRetriever::ContentRetriever(std::shared_ptr<Retriever> retriever)
      : retriever_{std::move(retriever)} {
    BOOST_ASSERT(retriever_ != nullptr);
  }

  outcome::result<std::pair<Manifest, std::vector<Chunk>>>
  ContentRetriever::fetchParts(const ContentHash &manifest_id) {
    OUTCOME_TRY(manifest, retriever_->fetchManifest(manifest_id));
    std::vector<Chunk> chunks;
    chunks.reserve(manifest.chunk_ids.size());
    for (const auto &chunk_id : manifest.chunk_ids) {
      OUTCOME_TRY(chunk, retriever_->fetchChunk(chunk_id));
      chunks.push_back(std::move(chunk));
    }
    return std::make_pair(std::move(manifest), std::move(chunks));
  }

  outcome::result<Bytes> ContentRetriever::retrieveContent(
      const ContentHash &manifest_id) {
    OUTCOME_TRY(parts, fetchParts(manifest_id));
    if (parts.first.id != manifest_id) {
      return service::ServiceError::INTEGRITY_ERROR;
    }
    return service::verifyContent(parts.first, parts.second);
  }

}  // namespace dds::retriever
