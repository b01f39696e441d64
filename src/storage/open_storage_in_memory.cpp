/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/storage/open_storage.hpp>

#include <dds/log/logger.hpp>
#include <dds/storage/in_memory_storage.hpp>

namespace dds::storage {

  outcome::result<std::shared_ptr<Storage>> openStorage(
      const std::string &path) {
    if (path.empty()) {
      return std::make_shared<InMemoryStorage>();
    }
    log::createLogger("Storage")->error(
        "cannot open {}: built without SQLite storage", path);
    return StorageError::PERSISTENCE_UNAVAILABLE;
  }

}  // namespace dds::storage
