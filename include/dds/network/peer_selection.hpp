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
   * Decides in which order discovered peers are asked for a manifest.
   * The first peer which answers supplies the chunks as well
   */
  class PeerSelectionStrategy {
   public:
    virtual ~PeerSelectionStrategy() = default;

    virtual std::vector<Node> order(std::vector<Node> peers) const = 0;
  };

  /// Keeps the order reported by discovery
  class DiscoveryOrder : public PeerSelectionStrategy {
   public:
    std::vector<Node> order(std::vector<Node> peers) const override;
  };

  /// Higher reputation first, ties keep the discovery order
  class ReputationOrder : public PeerSelectionStrategy {
   public:
    std::vector<Node> order(std::vector<Node> peers) const override;
  };

}  // namespace dds::network
