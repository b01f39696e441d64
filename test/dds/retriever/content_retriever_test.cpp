/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/retriever/content_retriever.hpp>

#include <gtest/gtest.h>

#include <dds/retriever/storage_retriever.hpp>
#include <dds/service/error.hpp>
#include <dds/storage/in_memory_storage.hpp>
#include "mock/dds/retriever/retriever_mock.hpp"
#include "testutil/dds/content.hpp"
#include "testutil/outcome.hpp"

using dds::retriever::ContentRetriever;
using dds::retriever::RetrieverMock;
using dds::retriever::StorageRetriever;
using dds::service::ServiceError;
using dds::storage::InMemoryStorage;
using dds::storage::StorageError;
using ::testing::_;
using ::testing::Return;

class ContentRetrieverTest : public ::testing::Test {
 public:
  testutil::Content content = testutil::makeContent("retrieved content", 5);
  std::shared_ptr<RetrieverMock> source = std::make_shared<RetrieverMock>();
  ContentRetriever retriever{source};
};

/**
 * @given a storage holding published content
 * @when retrieving it through a storage retriever
 * @then the content is reassembled
 */
TEST_F(ContentRetrieverTest, FromStorage) {
  auto storage = std::make_shared<InMemoryStorage>();
  for (const auto &chunk : content.chunks) {
    ASSERT_TRUE(storage->storeChunk(chunk));
  }
  ASSERT_TRUE(storage->storeManifest(content.manifest));

  ContentRetriever from_storage{std::make_shared<StorageRetriever>(storage)};
  EXPECT_OUTCOME_TRUE(data, from_storage.retrieveContent(content.manifest.id));
  ASSERT_EQ(data, content.data);
}

/**
 * @given a source serving the manifest and chunks
 * @when fetching parts
 * @then chunks are requested and returned in manifest order
 */
TEST_F(ContentRetrieverTest, PartsInManifestOrder) {
  ::testing::InSequence in_order;
  EXPECT_CALL(*source, fetchManifest(content.manifest.id))
      .WillOnce(Return(content.manifest));
  for (const auto &chunk : content.chunks) {
    EXPECT_CALL(*source, fetchChunk(chunk.id)).WillOnce(Return(chunk));
  }

  EXPECT_OUTCOME_TRUE(parts, retriever.fetchParts(content.manifest.id));
  ASSERT_EQ(parts.first, content.manifest);
  ASSERT_EQ(parts.second, content.chunks);
}

/**
 * @given a source without the manifest
 * @when retrieving
 * @then its error is returned and no chunk is requested
 */
TEST_F(ContentRetrieverTest, MissingManifest) {
  EXPECT_CALL(*source, fetchManifest(_))
      .WillOnce(Return(StorageError::MANIFEST_NOT_FOUND));
  EXPECT_CALL(*source, fetchChunk(_)).Times(0);

  EXPECT_EC(retriever.retrieveContent(content.manifest.id),
            StorageError::MANIFEST_NOT_FOUND);
}

/**
 * @given a source missing the second chunk
 * @when retrieving
 * @then fetching stops at the missing chunk with its error
 */
TEST_F(ContentRetrieverTest, MissingChunk) {
  EXPECT_CALL(*source, fetchManifest(_)).WillOnce(Return(content.manifest));
  EXPECT_CALL(*source, fetchChunk(content.chunks[0].id))
      .WillOnce(Return(content.chunks[0]));
  EXPECT_CALL(*source, fetchChunk(content.chunks[1].id))
      .WillOnce(Return(StorageError::CHUNK_NOT_FOUND));

  EXPECT_EC(retriever.retrieveContent(content.manifest.id),
            StorageError::CHUNK_NOT_FOUND);
}

/**
 * @given a source answering with the manifest of other content
 * @when retrieving
 * @then an integrity error is reported
 */
TEST_F(ContentRetrieverTest, ManifestOfOtherContent) {
  auto other = testutil::makeContent("other content", 5);
  EXPECT_CALL(*source, fetchManifest(_)).WillOnce(Return(other.manifest));
  for (const auto &chunk : other.chunks) {
    EXPECT_CALL(*source, fetchChunk(chunk.id)).WillOnce(Return(chunk));
  }

  EXPECT_EC(retriever.retrieveContent(content.manifest.id),
            ServiceError::INTEGRITY_ERROR);
}
