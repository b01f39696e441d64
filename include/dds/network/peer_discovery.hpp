/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <dds/network/node.hpp>

namespace dds::network {

  /**
   * Source of candidate peers. The returned set is a best-effort snapshot:
   * it may contain peers which are no longer reachable
   */
  class PeerDiscovery {
   public:
    virtual ~PeerDiscovery() = default;

    /**
     * @return currently known peers, possibly none, or
     * DiscoveryError::UNAVAILABLE if the mechanism itself is down
     */
    virtual outcome::result<std::vector<Node>> discoverPeers() = 0;
  };

}  // namespace dds::network
