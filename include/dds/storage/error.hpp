/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <dds/outcome/outcome.hpp>

namespace dds::storage {

  enum class StorageError {
    CHUNK_NOT_FOUND = 1,
    MANIFEST_NOT_FOUND,
    BACKEND_FAILURE,  ///< underlying database refused the operation
    CORRUPTED_RECORD,  ///< stored record cannot be decoded
    PERSISTENCE_UNAVAILABLE,  ///< built without a persistent backend
  };

}  // namespace dds::storage

OUTCOME_HPP_DECLARE_ERROR(dds::storage, StorageError)

namespace dds::storage {

  /// True for read-misses, which the retrieval path may recover from
  inline bool isNotFound(const std::error_code &ec) {
    return ec == StorageError::CHUNK_NOT_FOUND
        or ec == StorageError::MANIFEST_NOT_FOUND;
  }

}  // namespace dds::storage
