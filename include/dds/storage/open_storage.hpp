/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>

#include <dds/storage/storage.hpp>

namespace dds::storage {

  /**
   * Storage for a configured path
   * @param path - empty for in-memory storage, otherwise an SQLite file
   * @return storage, or StorageError::PERSISTENCE_UNAVAILABLE for a path
   * when the SQLite backend is not built
   */
  outcome::result<std::shared_ptr<Storage>> openStorage(
      const std::string &path);

}  // namespace dds::storage
