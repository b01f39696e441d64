/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/host/dds_host.hpp>

#include <boost/assert.hpp>

#include <dds/chunking/fixed_size_chunker.hpp>
#include <dds/crypto/random_source/boost_random_source.hpp>
#include <dds/storage/open_storage.hpp>

namespace dds::host {

  outcome::result<std::unique_ptr<DdsHost>> DdsHost::create(
      const service::Config &config) {
    OUTCOME_TRY(storage, storage::openStorage(config.storagePath));
    return create(config, std::move(storage));
  }

  outcome::result<std::unique_ptr<DdsHost>> DdsHost::create(
      const service::Config &config,
      std::shared_ptr<storage::Storage> storage) {
    BOOST_ASSERT(storage != nullptr);
    std::unique_ptr<DdsHost> host{new DdsHost()};
    host->storage_ = std::move(storage);
    host->discovery_ = std::make_shared<network::BootstrapPeerDiscovery>(
        config.bootstrapPeers);
    host->originator_ = std::make_shared<originator::LocalOriginator>();

    host->server_ = std::make_unique<network::PeerServer>(
        host->storage_,
        [discovery{host->discovery_}](const network::Node &advertiser,
                                      const content::ContentHash &id) {
          discovery->recordAdvertisement(advertiser, id);
        },
        config.maxMessageSize);
    OUTCOME_TRY(host->server_->listen(config.listenAddress));
    OUTCOME_TRY(listen_address, host->server_->listenAddress());
    host->listen_address_ = std::move(listen_address);

    crypto::random::BoostRandomSource random;
    OUTCOME_TRY(local_node,
                network::Node::create(
                    host->listen_address_, config.localReputation, random));

    host->transport_ = std::make_shared<network::TcpPeerTransport>(
        std::move(local_node),
        host->discovery_,
        network::TcpPeerTransport::Config{
            .advertise_timeout = config.connectionTimeout,
            .max_message_size = config.maxMessageSize,
        });

    host->service_ = std::make_unique<service::DdsServiceImpl>(
        std::make_shared<chunking::FixedSizeChunker>(config.chunkSize),
        host->storage_,
        host->originator_,
        host->discovery_,
        host->transport_,
        std::make_shared<network::DiscoveryOrder>(),
        config);
    return host;
  }

  DdsHost::~DdsHost() {
    stop();
  }

  service::DdsService &DdsHost::service() {
    return *service_;
  }

  network::Node DdsHost::localNode() const {
    return transport_->localNode();
  }

  const std::string &DdsHost::listenAddress() const {
    return listen_address_;
  }

  std::shared_ptr<network::BootstrapPeerDiscovery> DdsHost::discovery() const {
    return discovery_;
  }

  std::shared_ptr<originator::LocalOriginator> DdsHost::originator() const {
    return originator_;
  }

  std::shared_ptr<storage::Storage> DdsHost::storage() const {
    return storage_;
  }

  void DdsHost::stop() {
    if (server_) {
      server_->stop();
    }
  }

}  // namespace dds::host
