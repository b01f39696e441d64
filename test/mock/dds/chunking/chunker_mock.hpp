/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <dds/chunking/chunker.hpp>

#include <gmock/gmock.h>

namespace dds::chunking {
  struct ChunkerMock : public Chunker {
    ~ChunkerMock() override = default;

    MOCK_CONST_METHOD1(chunkContent,
                       outcome::result<std::vector<Chunk>>(BytesIn));

    MOCK_CONST_METHOD2(generateManifest,
                       outcome::result<Manifest>(const std::vector<Chunk> &,
                                                 BytesIn));
  };
}  // namespace dds::chunking
