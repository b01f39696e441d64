/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/service/content_verifier.hpp>

namespace dds::service {

  outcome::result<Bytes> verifyContent(
      const chunking::Manifest &manifest,
      const std::vector<chunking::Chunk> &chunks) {
    OUTCOME_TRY(manifest_id,
                chunking::computeManifestId(manifest.content_id,
                                            manifest.chunk_ids));
    if (manifest_id != manifest.id) {
      return ServiceError::INTEGRITY_ERROR;
    }
    if (chunks.size() != manifest.chunk_ids.size()) {
      return ServiceError::INTEGRITY_ERROR;
    }

    // total_size is not covered by the manifest id
    size_t received = 0;
    for (const auto &chunk : chunks) {
      received += chunk.data.size();
    }
    if (received != manifest.total_size) {
      return ServiceError::SIZE_MISMATCH;
    }

    Bytes content;
    content.reserve(received);
    for (size_t i = 0; i < chunks.size(); ++i) {
      const auto &chunk = chunks[i];
      if (chunk.id != manifest.chunk_ids[i]) {
        return ServiceError::INTEGRITY_ERROR;
      }
      OUTCOME_TRY(actual, content::ContentHash::compute(chunk.data));
      if (actual != chunk.id) {
        return ServiceError::INTEGRITY_ERROR;
      }
      if (chunk.size != chunk.data.size()) {
        return ServiceError::SIZE_MISMATCH;
      }
      content.insert(content.end(), chunk.data.begin(), chunk.data.end());
    }

    if (content.size() != manifest.total_size) {
      return ServiceError::SIZE_MISMATCH;
    }
    OUTCOME_TRY(content_id, content::ContentHash::compute(content));
    if (content_id != manifest.content_id) {
      return ServiceError::INTEGRITY_ERROR;
    }
    return content;
  }

}  // namespace dds::service
