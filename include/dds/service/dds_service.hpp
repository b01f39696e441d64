/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include <dds/content/content_hash.hpp>
#include <dds/service/error.hpp>

namespace dds::service {

  using content::ContentHash;

  /**
   * Content-addressed store: content is published once and retrieved by its
   * manifest id, from local storage or from peers
   */
  class DdsService {
   public:
    virtual ~DdsService() = default;

    /**
     * Chunk, store and advertise content
     * @param content - must not be empty
     * @return manifest id, returned only once content is stored locally
     */
    virtual outcome::result<ContentHash> publish(BytesIn content) = 0;

    /**
     * Resolve a manifest id to verified content
     * @param manifest_id - hex rendering of the manifest hash
     */
    virtual outcome::result<Bytes> retrieve(std::string_view manifest_id) = 0;
  };

}  // namespace dds::service
