/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <dds/outcome/outcome.hpp>

namespace dds::service {

  enum class ServiceError {
    EMPTY_MANIFEST_ID = 1,
    INVALID_MANIFEST_ID,     ///< not a rendered content hash
    NETWORK_NOT_CONFIGURED,  ///< content is not local and there is no network
    NO_PEERS,
    MANIFEST_UNAVAILABLE,  ///< no peer supplied the manifest
    CHUNK_FETCH_FAILED,
    INTEGRITY_ERROR,  ///< data does not match its address
    SIZE_MISMATCH,
    CACHE_FAILED,
  };

}  // namespace dds::service

OUTCOME_HPP_DECLARE_ERROR(dds::service, ServiceError)
