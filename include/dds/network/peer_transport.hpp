/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

#include <dds/chunking/chunk.hpp>
#include <dds/network/node.hpp>

namespace dds::network {

  using chunking::Chunk;
  using chunking::Manifest;

  /**
   * Talks to one given peer. Choosing which peers to ask is left to the
   * caller; every request gives up once its timeout elapses
   */
  class PeerTransport {
   public:
    using Timeout = std::chrono::milliseconds;

    virtual ~PeerTransport() = default;

    /**
     * Ask @param peer for a manifest
     * @return the manifest as sent by the peer, unverified;
     * TransportError::PEER_NOT_FOUND if the peer cannot be reached,
     * TransportError::MANIFEST_UNAVAILABLE if it does not serve the manifest,
     * TransportError::TIMEOUT if it did not answer in time
     */
    virtual outcome::result<Manifest> requestManifest(
        const Node &peer, const ContentHash &manifest_id, Timeout timeout) = 0;

    /**
     * Ask @param peer for a chunk, same failure modes as requestManifest()
     * with TransportError::CHUNK_UNAVAILABLE on a miss
     */
    virtual outcome::result<Chunk> requestChunk(const Node &peer,
                                                const ContentHash &chunk_id,
                                                Timeout timeout) = 0;

    /**
     * Announce that the local node serves @param manifest_id. The local
     * node remembers the id even when nobody could be told
     */
    virtual outcome::result<void> advertiseContent(
        const ContentHash &manifest_id) = 0;
  };

}  // namespace dds::network
