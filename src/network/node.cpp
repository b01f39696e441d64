/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/network/node.hpp>

#include <algorithm>
#include <array>

#include <dds/common/hexutil.hpp>
#include <dds/network/error.hpp>

namespace dds::network {

  outcome::result<Node> Node::create(std::string address,
                                     int reputation,
                                     crypto::random::RandomSource &random) {
    if (address.empty()) {
      return NodeError::EMPTY_ADDRESS;
    }
    std::array<uint8_t, kIdLength> raw{};
    random.fill(raw);
    return Node{common::hex_lower(raw), std::move(address), reputation};
  }

  Node::Node(std::string id, std::string address, int reputation)
      : id_{std::move(id)},
        address_{std::move(address)},
        reputation_{reputation} {}

  const std::string &Node::id() const {
    return id_;
  }

  const std::string &Node::address() const {
    return address_;
  }

  int Node::reputationScore() const {
    return reputation_;
  }

  const std::vector<ContentHash> &Node::knownContent() const {
    return known_content_;
  }

  bool Node::advertises(const ContentHash &id) const {
    return std::find(known_content_.begin(), known_content_.end(), id)
        != known_content_.end();
  }

  void Node::addAdvertisedContent(const ContentHash &id) {
    if (not advertises(id)) {
      known_content_.push_back(id);
    }
  }

  std::string Node::toString() const {
    return fmt::format("Node{{ID: {}..., Address: {}, Reputation: {}, "
                       "KnownContentCount: {}}}",
                       id_.substr(0, 8),
                       address_,
                       reputation_,
                       known_content_.size());
  }

}  // namespace dds::network
