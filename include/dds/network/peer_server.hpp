/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>
#include <string_view>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <dds/log/logger.hpp>
#include <dds/network/message.hpp>
#include <dds/storage/storage.hpp>

namespace dds::network {

  /**
   * Answers other nodes: manifests and chunks are served from local storage,
   * advertisements are handed to the registered callback. Runs its own
   * io_context on a background thread between listen() and stop()
   */
  class PeerServer {
   public:
    using AdvertiseHandler =
        std::function<void(const Node &advertiser, const ContentHash &id)>;

    PeerServer(std::shared_ptr<storage::Storage> storage,
               AdvertiseHandler on_advertise,
               size_t max_message_size);

    PeerServer(const PeerServer &) = delete;
    PeerServer &operator=(const PeerServer &) = delete;

    ~PeerServer();

    /**
     * Bind and start serving
     * @param address - "host:port", port 0 picks a free one
     */
    outcome::result<void> listen(std::string_view address);

    /// Address actually bound, usable by other nodes to connect
    outcome::result<std::string> listenAddress() const;

    /// Stop accepting and drop open connections; safe to call twice
    void stop();

    /**
     * Answer to a single request
     * @return response, or MessageError::UNKNOWN_TYPE if @param request is
     * itself a response
     */
    outcome::result<Message> handle(const Message &request);

   private:
    using Tcp = boost::asio::ip::tcp;

    void doAccept();

    void readRequest(std::shared_ptr<Tcp::socket> socket);

    std::shared_ptr<storage::Storage> storage_;
    AdvertiseHandler on_advertise_;
    size_t max_message_size_;
    boost::asio::io_context context_;
    Tcp::acceptor acceptor_;
    std::thread thread_;
    log::Logger log_;
  };

}  // namespace dds::network
