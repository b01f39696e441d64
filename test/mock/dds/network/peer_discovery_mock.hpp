/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <dds/network/peer_discovery.hpp>

#include <gmock/gmock.h>

namespace dds::network {
  struct PeerDiscoveryMock : public PeerDiscovery {
    ~PeerDiscoveryMock() override = default;

    MOCK_METHOD0(discoverPeers, outcome::result<std::vector<Node>>());
  };
}  // namespace dds::network
