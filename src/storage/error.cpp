/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/storage/error.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(dds::storage, StorageError, e) {
  using dds::storage::StorageError;
  switch (e) {
    case StorageError::CHUNK_NOT_FOUND:
      return "chunk not found in local storage";
    case StorageError::MANIFEST_NOT_FOUND:
      return "manifest not found in local storage";
    case StorageError::BACKEND_FAILURE:
      return "storage backend failure";
    case StorageError::CORRUPTED_RECORD:
      return "stored record is corrupted";
    case StorageError::PERSISTENCE_UNAVAILABLE:
      return "persistent storage is not available in this build";
  }
  return "unknown storage error";
}
