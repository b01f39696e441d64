/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/network/bootstrap_peer_discovery.hpp>

#include <algorithm>

#include <dds/network/error.hpp>

namespace dds::network {

  namespace {
    /// Bootstrap peers have no announced identity yet, their address stands in
    std::string bootstrapId(const std::string &address) {
      return "bootstrap:" + address;
    }
  }  // namespace

  BootstrapPeerDiscovery::BootstrapPeerDiscovery(
      const std::vector<std::string> &bootstrap_addresses)
      : log_{log::createLogger("BootstrapPeerDiscovery")} {
    for (const auto &address : bootstrap_addresses) {
      if (address.empty()) {
        log_->warn("skipping empty bootstrap address");
        continue;
      }
      if (findByAddress(address) == peers_.end()) {
        peers_.emplace_back(bootstrapId(address), address, kDefaultReputation);
      }
    }
  }

  outcome::result<std::vector<Node>> BootstrapPeerDiscovery::discoverPeers() {
    if (not available_) {
      return DiscoveryError::UNAVAILABLE;
    }
    std::lock_guard lock(mutex_);
    return peers_;
  }

  void BootstrapPeerDiscovery::addPeer(Node peer) {
    std::lock_guard lock(mutex_);
    auto it = findByAddress(peer.address());
    if (it == peers_.end()) {
      log_->debug("new peer {}", peer);
      peers_.push_back(std::move(peer));
      return;
    }
    for (const auto &id : it->knownContent()) {
      peer.addAdvertisedContent(id);
    }
    *it = std::move(peer);
  }

  void BootstrapPeerDiscovery::recordAdvertisement(
      const Node &advertiser, const ContentHash &manifest_id) {
    std::lock_guard lock(mutex_);
    auto it = findByAddress(advertiser.address());
    if (it == peers_.end()) {
      peers_.push_back(advertiser);
      it = std::prev(peers_.end());
    } else if (it->id() != advertiser.id()) {
      Node refreshed{advertiser.id(), advertiser.address(),
                     advertiser.reputationScore()};
      for (const auto &id : it->knownContent()) {
        refreshed.addAdvertisedContent(id);
      }
      *it = std::move(refreshed);
    }
    it->addAdvertisedContent(manifest_id);
    log_->debug("peer {} advertises {}", *it, manifest_id);
  }

  void BootstrapPeerDiscovery::setAvailable(bool available) {
    available_ = available;
  }

  std::vector<Node>::iterator BootstrapPeerDiscovery::findByAddress(
      const std::string &address) {
    return std::find_if(peers_.begin(), peers_.end(), [&](const Node &peer) {
      return peer.address() == address;
    });
  }

}  // namespace dds::network
