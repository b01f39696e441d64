/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/chunking/chunk.hpp>

#include <dds/crypto/sha256.hpp>

namespace dds::chunking {

  outcome::result<ContentHash> computeManifestId(
      const ContentHash &content_id,
      const std::vector<ContentHash> &chunk_ids) {
    crypto::Sha256Hasher hasher;
    OUTCOME_TRY(hasher.update(content_id.toHex()));
    for (const auto &id : chunk_ids) {
      OUTCOME_TRY(hasher.update(id.toHex()));
    }
    OUTCOME_TRY(digest, hasher.finish());
    return ContentHash::fromDigest(digest);
  }

}  // namespace dds::chunking
