/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include <dds/content/content_hash.hpp>
#include <dds/crypto/random_source.hpp>

namespace dds::network {

  using content::ContentHash;

  /**
   * A participant of the network: identity, endpoint, the manifests it
   * advertises and an externally supplied reputation score.
   *
   * Node is a plain value; whoever shares one between threads guards it.
   * Advertised content only grows
   */
  class Node {
   public:
    /// Length of a generated identifier, in bytes
    static constexpr size_t kIdLength = 16;

    /**
     * Create a node with a fresh random identifier
     * @param address - "host:port" endpoint, must not be empty
     * @param reputation - ordering hint for peer selection
     * @param random - identifier source
     */
    static outcome::result<Node> create(
        std::string address,
        int reputation,
        crypto::random::RandomSource &random);

    /// Node with an already known identifier
    Node(std::string id, std::string address, int reputation);

    const std::string &id() const;

    const std::string &address() const;

    int reputationScore() const;

    /// Advertised manifest ids in the order they were learned
    const std::vector<ContentHash> &knownContent() const;

    bool advertises(const ContentHash &id) const;

    /// Remember that this node serves @param id; repeated ids are ignored
    void addAdvertisedContent(const ContentHash &id);

    /// Short human-readable form for logs
    std::string toString() const;

    bool operator==(const Node &other) const = default;

   private:
    std::string id_;
    std::string address_;
    std::vector<ContentHash> known_content_;
    int reputation_;
  };

}  // namespace dds::network

template <>
struct fmt::formatter<dds::network::Node> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const dds::network::Node &node, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(node.toString(), ctx);
  }
};
