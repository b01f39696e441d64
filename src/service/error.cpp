/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/service/error.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(dds::service, ServiceError, e) {
  using dds::service::ServiceError;
  switch (e) {
    case ServiceError::EMPTY_MANIFEST_ID:
      return "manifest id is empty";
    case ServiceError::INVALID_MANIFEST_ID:
      return "manifest id is not a content hash";
    case ServiceError::NETWORK_NOT_CONFIGURED:
      return "content is not stored locally and no network is configured";
    case ServiceError::NO_PEERS:
      return "no peers available";
    case ServiceError::MANIFEST_UNAVAILABLE:
      return "manifest is not available from any peer";
    case ServiceError::CHUNK_FETCH_FAILED:
      return "chunk could not be fetched";
    case ServiceError::INTEGRITY_ERROR:
      return "content integrity check failed";
    case ServiceError::SIZE_MISMATCH:
      return "content size does not match manifest";
    case ServiceError::CACHE_FAILED:
      return "retrieved content could not be cached";
  }
  return "unknown service error";
}
