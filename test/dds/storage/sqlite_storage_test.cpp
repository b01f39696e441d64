/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/storage/sqlite_storage.hpp>

#include <dds/storage/in_memory_storage.hpp>
#include <dds/storage/open_storage.hpp>

#include <boost/filesystem.hpp>
#include <gtest/gtest.h>

#include "testutil/dds/content.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using dds::storage::SqliteStorage;
using dds::storage::StorageError;

/// Fixture for in-memory SQLite tests
class SqliteStorageTest : public ::testing::Test {
 public:
  void SetUp() override {
    testutil::prepareLoggers();
    storage = SqliteStorage::create(":memory:").value();
  }

  std::unique_ptr<SqliteStorage> storage;
  testutil::Content content = testutil::makeContent("persisted content");
};

/**
 * @given an empty database
 * @when reading a chunk and a manifest
 * @then not-found errors are reported
 */
TEST_F(SqliteStorageTest, MissReportsNotFound) {
  EXPECT_EC(storage->getChunk(content.chunks[0].id),
            StorageError::CHUNK_NOT_FOUND);
  EXPECT_EC(storage->getManifest(content.manifest.id),
            StorageError::MANIFEST_NOT_FOUND);
}

/**
 * @given stored chunks and manifest
 * @when reading them back
 * @then equal values are returned, chunk order of the manifest included
 */
TEST_F(SqliteStorageTest, StoreAndGet) {
  for (const auto &chunk : content.chunks) {
    EXPECT_OUTCOME_TRUE_1(storage->storeChunk(chunk));
  }
  EXPECT_OUTCOME_TRUE_1(storage->storeManifest(content.manifest));

  for (const auto &chunk : content.chunks) {
    EXPECT_OUTCOME_TRUE(stored, storage->getChunk(chunk.id));
    ASSERT_EQ(stored, chunk);
  }
  EXPECT_OUTCOME_TRUE(manifest, storage->getManifest(content.manifest.id));
  ASSERT_EQ(manifest, content.manifest);
}

/**
 * @given a stored chunk
 * @when storing other data under the same id
 * @then the last write wins
 */
TEST_F(SqliteStorageTest, OverwriteIsLastWriteWins) {
  auto chunk = content.chunks[0];
  EXPECT_OUTCOME_TRUE_1(storage->storeChunk(chunk));
  chunk.data = testutil::bytes("replaced");
  chunk.size = chunk.data.size();
  EXPECT_OUTCOME_TRUE_1(storage->storeChunk(chunk));

  EXPECT_OUTCOME_TRUE(stored, storage->getChunk(chunk.id));
  ASSERT_EQ(stored, chunk);
}

/// Fixture for tests which require a file being saved on disk
class SqliteStoragePersistence : public ::testing::Test {
 public:
  ~SqliteStoragePersistence() override {
    if (boost::filesystem::exists(kTestDbFile)) {
      boost::filesystem::remove(kTestDbFile);
    }
  }

  const std::string kTestDbFile = "dds_storage_test.sqlite";
};

/**
 * @given content stored through openStorage() with a file path
 * @when the storage is closed and opened again
 * @then the content is still available
 */
TEST_F(SqliteStoragePersistence, SurvivesReopen) {
  auto content = testutil::makeContent("durable content");
  {
    EXPECT_OUTCOME_TRUE(storage, dds::storage::openStorage(kTestDbFile));
    for (const auto &chunk : content.chunks) {
      EXPECT_OUTCOME_TRUE_1(storage->storeChunk(chunk));
    }
    EXPECT_OUTCOME_TRUE_1(storage->storeManifest(content.manifest));
  }

  EXPECT_OUTCOME_TRUE(reopened, dds::storage::openStorage(kTestDbFile));
  EXPECT_OUTCOME_TRUE(manifest, reopened->getManifest(content.manifest.id));
  ASSERT_EQ(manifest, content.manifest);
  EXPECT_OUTCOME_TRUE(chunk, reopened->getChunk(content.chunks[0].id));
  ASSERT_EQ(chunk, content.chunks[0]);
}

/**
 * @given an empty path
 * @when opening storage
 * @then an in-memory storage is returned
 */
TEST(OpenStorage, EmptyPathIsInMemory) {
  EXPECT_OUTCOME_TRUE(storage, dds::storage::openStorage(""));
  ASSERT_NE(std::dynamic_pointer_cast<dds::storage::InMemoryStorage>(storage),
            nullptr);
}
