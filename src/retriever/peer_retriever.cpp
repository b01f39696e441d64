/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/retriever/peer_retriever.hpp>

#include <boost/assert.hpp>

namespace dds::retriever {

  PeerRetriever::PeerRetriever(
      std::shared_ptr<network::PeerTransport> transport,
      network::Node peer,
      network::PeerTransport::Timeout timeout)
      : transport_{std::move(transport)},
        peer_{std::move(peer)},
        timeout_{timeout} {
    BOOST_ASSERT(transport_ != nullptr);
  }

  outcome::result<Manifest> PeerRetriever::fetchManifest(
      const ContentHash &id) {
    return transport_->requestManifest(peer_, id, timeout_);
  }

  outcome::result<Chunk> PeerRetriever::fetchChunk(const ContentHash &id) {
    return transport_->requestChunk(peer_, id, timeout_);
  }

  const network::Node &PeerRetriever::peer() const {
    return peer_;
  }

}  // namespace dds::retriever
