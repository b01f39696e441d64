/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <dds/chunking/chunker.hpp>
#include <dds/log/logger.hpp>
#include <dds/originator/originator.hpp>
#include <dds/storage/storage.hpp>

namespace dds::service {

  /**
   * Publishing half of the store: persists and seeds content for callers
   * which never retrieve
   */
  class Publisher {
   public:
    Publisher(std::shared_ptr<chunking::Chunker> chunker,
              std::shared_ptr<storage::Storage> storage,
              std::shared_ptr<originator::Originator> originator);

    /**
     * Chunk and store content, then seed it through the originator. Seeding
     * failures are logged only
     * @return manifest id; ChunkerError::EMPTY_CONTENT for empty content, in
     * which case nothing is stored
     */
    outcome::result<content::ContentHash> publishContent(BytesIn content);

   private:
    std::shared_ptr<chunking::Chunker> chunker_;
    std::shared_ptr<storage::Storage> storage_;
    std::shared_ptr<originator::Originator> originator_;
    log::Logger log_;
  };

}  // namespace dds::service
