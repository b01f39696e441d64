/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <mutex>

#include <dds/log/logger.hpp>
#include <dds/network/peer_discovery.hpp>

namespace dds::network {

  /**
   * Peer registry seeded with bootstrap addresses, which grows with the
   * advertisements received from other nodes. Peers are unique by address
   * and are returned in the order they became known
   */
  class BootstrapPeerDiscovery : public PeerDiscovery {
   public:
    /// Reputation given to peers known only by address
    static constexpr int kDefaultReputation = 0;

    explicit BootstrapPeerDiscovery(
        const std::vector<std::string> &bootstrap_addresses);

    ~BootstrapPeerDiscovery() override = default;

    outcome::result<std::vector<Node>> discoverPeers() override;

    /// Add a peer or refresh the identity of the one with the same address
    void addPeer(Node peer);

    /**
     * Remember that a peer serves a manifest, registering the peer first if
     * needed
     */
    void recordAdvertisement(const Node &advertiser,
                             const ContentHash &manifest_id);

    /// While unavailable, discoverPeers() fails with DiscoveryError
    void setAvailable(bool available);

   private:
    std::vector<Node>::iterator findByAddress(const std::string &address);

    mutable std::mutex mutex_;
    std::vector<Node> peers_;
    std::atomic_bool available_{true};
    log::Logger log_;
  };

}  // namespace dds::network
