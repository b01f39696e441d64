/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <dds/network/bootstrap_peer_discovery.hpp>
#include <dds/network/peer_server.hpp>
#include <dds/network/tcp_peer_transport.hpp>
#include <dds/originator/local_originator.hpp>
#include <dds/service/config.hpp>
#include <dds/service/dds_service_impl.hpp>

namespace dds::host {

  /**
   * @brief A complete node of the store:
   * - serves its storage to other nodes over TCP
   * - learns peers from bootstrap addresses and advertisements
   * - publishes and retrieves through DdsService
   */
  class DdsHost {
   public:
    /**
     * Assemble a node over the storage named by Config::storagePath
     * @return host, or the error of storage::openStorage()
     */
    static outcome::result<std::unique_ptr<DdsHost>> create(
        const service::Config &config);

    /**
     * Assemble a node and start serving on Config::listenAddress
     * @param storage - local persistence, Config::storagePath is ignored
     */
    static outcome::result<std::unique_ptr<DdsHost>> create(
        const service::Config &config,
        std::shared_ptr<storage::Storage> storage);

    DdsHost(const DdsHost &) = delete;
    DdsHost &operator=(const DdsHost &) = delete;

    ~DdsHost();

    service::DdsService &service();

    /// Identity and advertised content of this node
    network::Node localNode() const;

    const std::string &listenAddress() const;

    std::shared_ptr<network::BootstrapPeerDiscovery> discovery() const;

    std::shared_ptr<originator::LocalOriginator> originator() const;

    std::shared_ptr<storage::Storage> storage() const;

    /// Stop serving other nodes; publish and retrieve keep working
    void stop();

   private:
    DdsHost() = default;

    std::shared_ptr<storage::Storage> storage_;
    std::shared_ptr<network::BootstrapPeerDiscovery> discovery_;
    std::shared_ptr<originator::LocalOriginator> originator_;
    std::unique_ptr<network::PeerServer> server_;
    std::shared_ptr<network::TcpPeerTransport> transport_;
    std::unique_ptr<service::DdsServiceImpl> service_;
    std::string listen_address_;
  };

}  // namespace dds::host
