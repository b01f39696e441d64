/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/network/peer_selection.hpp>

#include <algorithm>

namespace dds::network {

  std::vector<Node> DiscoveryOrder::order(std::vector<Node> peers) const {
    return peers;
  }

  std::vector<Node> ReputationOrder::order(std::vector<Node> peers) const {
    std::stable_sort(
        peers.begin(), peers.end(), [](const Node &l, const Node &r) {
          return l.reputationScore() > r.reputationScore();
        });
    return peers;
  }

}  // namespace dds::network
