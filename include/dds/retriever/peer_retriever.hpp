/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <dds/network/peer_transport.hpp>
#include <dds/retriever/retriever.hpp>

namespace dds::retriever {

  /// Asks one peer through the transport, every request bounded by timeout
  class PeerRetriever : public Retriever {
   public:
    PeerRetriever(std::shared_ptr<network::PeerTransport> transport,
                  network::Node peer,
                  network::PeerTransport::Timeout timeout);

    outcome::result<Manifest> fetchManifest(const ContentHash &id) override;

    outcome::result<Chunk> fetchChunk(const ContentHash &id) override;

    const network::Node &peer() const;

   private:
    std::shared_ptr<network::PeerTransport> transport_;
    network::Node peer_;
    network::PeerTransport::Timeout timeout_;
  };

}  // namespace dds::retriever
