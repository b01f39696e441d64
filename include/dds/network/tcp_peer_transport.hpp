/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <mutex>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <dds/log/logger.hpp>
#include <dds/network/message.hpp>
#include <dds/network/peer_discovery.hpp>
#include <dds/network/peer_transport.hpp>

namespace dds::network {

  /**
   * PeerTransport over plain TCP. Every request opens its own connection,
   * sends one frame and waits for one answer. Connections run on an own
   * io_context thread; the caller waits at most the request timeout, name
   * resolution included
   */
  class TcpPeerTransport : public PeerTransport {
   public:
    struct Config {
      /// Bound on delivering one advertisement to one peer
      Timeout advertise_timeout = std::chrono::seconds(3);

      /// Answers with a longer body are rejected as malformed
      size_t max_message_size = 16 * 1024 * 1024;
    };

    TcpPeerTransport(Node local_node,
                     std::shared_ptr<PeerDiscovery> discovery,
                     Config config);

    TcpPeerTransport(const TcpPeerTransport &) = delete;
    TcpPeerTransport &operator=(const TcpPeerTransport &) = delete;

    ~TcpPeerTransport() override;

    outcome::result<Manifest> requestManifest(const Node &peer,
                                              const ContentHash &manifest_id,
                                              Timeout timeout) override;

    outcome::result<Chunk> requestChunk(const Node &peer,
                                        const ContentHash &chunk_id,
                                        Timeout timeout) override;

    outcome::result<void> advertiseContent(
        const ContentHash &manifest_id) override;

    /// Snapshot of the local node, including what it advertises
    Node localNode() const;

   private:
    /// Send @param request to @param peer and wait for a single answer
    outcome::result<Message> exchange(const Node &peer,
                                      const Message &request,
                                      Timeout timeout);

    mutable std::mutex mutex_;
    Node local_node_;
    std::shared_ptr<PeerDiscovery> discovery_;
    Config config_;
    log::Logger log_;
    boost::asio::io_context context_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type>
        work_;
    std::thread thread_;
  };

}  // namespace dds::network
