/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/storage/in_memory_storage.hpp>

#include <thread>

#include <gtest/gtest.h>

#include "testutil/dds/content.hpp"
#include "testutil/outcome.hpp"

using dds::storage::InMemoryStorage;
using dds::storage::StorageError;

class InMemoryStorageTest : public ::testing::Test {
 public:
  InMemoryStorage storage;
  testutil::Content content = testutil::makeContent("some stored content");
};

/**
 * @given an empty storage
 * @when reading a chunk and a manifest
 * @then not-found errors are reported
 */
TEST_F(InMemoryStorageTest, MissReportsNotFound) {
  EXPECT_EC(storage.getChunk(content.chunks[0].id),
            StorageError::CHUNK_NOT_FOUND);
  EXPECT_EC(storage.getManifest(content.manifest.id),
            StorageError::MANIFEST_NOT_FOUND);

  auto miss = storage.getChunk(content.chunks[0].id);
  ASSERT_TRUE(dds::storage::isNotFound(miss.error()));
}

/**
 * @given stored chunks and manifest
 * @when reading them back
 * @then equal values are returned
 */
TEST_F(InMemoryStorageTest, StoreAndGet) {
  for (const auto &chunk : content.chunks) {
    EXPECT_OUTCOME_TRUE_1(storage.storeChunk(chunk));
  }
  EXPECT_OUTCOME_TRUE_1(storage.storeManifest(content.manifest));

  for (const auto &chunk : content.chunks) {
    EXPECT_OUTCOME_TRUE(stored, storage.getChunk(chunk.id));
    ASSERT_EQ(stored, chunk);
  }
  EXPECT_OUTCOME_TRUE(manifest, storage.getManifest(content.manifest.id));
  ASSERT_EQ(manifest, content.manifest);
  ASSERT_EQ(storage.chunkCount(), content.chunks.size());
  ASSERT_EQ(storage.manifestCount(), 1);
}

/**
 * @given a stored chunk
 * @when storing other data under the same id
 * @then the last write wins and no id check is made
 */
TEST_F(InMemoryStorageTest, OverwriteIsLastWriteWins) {
  auto chunk = content.chunks[0];
  EXPECT_OUTCOME_TRUE_1(storage.storeChunk(chunk));
  chunk.data = testutil::bytes("replaced");
  chunk.size = chunk.data.size();
  EXPECT_OUTCOME_TRUE_1(storage.storeChunk(chunk));

  EXPECT_OUTCOME_TRUE(stored, storage.getChunk(chunk.id));
  ASSERT_EQ(stored.data, testutil::bytes("replaced"));
  ASSERT_EQ(storage.chunkCount(), 1);
}

/**
 * @given writers and readers running concurrently
 * @when they finish
 * @then every written chunk can be read
 */
TEST_F(InMemoryStorageTest, ConcurrentAccess) {
  auto many = testutil::makeContent(std::string(1000, 'a') + "tail", 4);
  std::vector<std::thread> threads;
  for (size_t t = 0; t < 4; ++t) {
    threads.emplace_back([&, t] {
      for (size_t i = t; i < many.chunks.size(); i += 4) {
        ASSERT_TRUE(storage.storeChunk(many.chunks[i]));
        ASSERT_TRUE(storage.getChunk(many.chunks[i].id));
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }
  for (const auto &chunk : many.chunks) {
    ASSERT_TRUE(storage.getChunk(chunk.id));
  }
}
