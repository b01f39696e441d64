/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <dds/storage/storage.hpp>

#include <gmock/gmock.h>

namespace dds::storage {
  struct StorageMock : public Storage {
    ~StorageMock() override = default;

    MOCK_METHOD1(storeChunk, outcome::result<void>(const Chunk &));

    MOCK_CONST_METHOD1(getChunk, outcome::result<Chunk>(const ContentHash &));

    MOCK_METHOD1(storeManifest, outcome::result<void>(const Manifest &));

    MOCK_CONST_METHOD1(getManifest,
                       outcome::result<Manifest>(const ContentHash &));
  };
}  // namespace dds::storage
