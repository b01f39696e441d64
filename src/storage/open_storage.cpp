/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/storage/open_storage.hpp>

#include <dds/storage/in_memory_storage.hpp>
#include <dds/storage/sqlite_storage.hpp>

namespace dds::storage {

  outcome::result<std::shared_ptr<Storage>> openStorage(
      const std::string &path) {
    if (path.empty()) {
      return std::make_shared<InMemoryStorage>();
    }
    OUTCOME_TRY(storage, SqliteStorage::create(path));
    return std::shared_ptr<Storage>{std::move(storage)};
  }

}  // namespace dds::storage
