/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/service/publisher.hpp>

#include <boost/assert.hpp>

namespace dds::service {

  Publisher::Publisher(std::shared_ptr<chunking::Chunker> chunker,
                       std::shared_ptr<storage::Storage> storage,
                       std::shared_ptr<originator::Originator> originator)
      : chunker_{std::move(chunker)},
        storage_{std::move(storage)},
        originator_{std::move(originator)},
        log_{log::createLogger("Publisher")} {
    BOOST_ASSERT(chunker_ != nullptr);
    BOOST_ASSERT(storage_ != nullptr);
    BOOST_ASSERT(originator_ != nullptr);
  }

  outcome::result<content::ContentHash> Publisher::publishContent(
      BytesIn content) {
    OUTCOME_TRY(chunks, chunker_->chunkContent(content));
    OUTCOME_TRY(manifest, chunker_->generateManifest(chunks, content));

    for (const auto &chunk : chunks) {
      OUTCOME_TRY(storage_->storeChunk(chunk));
    }
    // manifest goes last, so a stored manifest always has its chunks
    OUTCOME_TRY(storage_->storeManifest(manifest));

    auto seeded = originator_->advertiseContent(manifest.id);
    if (seeded.has_error()) {
      log_->warn("cannot seed {}: {}", manifest.id, seeded.error());
    }

    log_->info("published {} ({} bytes in {} chunks)",
               manifest.id,
               manifest.total_size,
               chunks.size());
    return manifest.id;
  }

}  // namespace dds::service
