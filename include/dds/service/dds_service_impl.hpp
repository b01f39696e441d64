/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>

#include <dds/log/logger.hpp>
#include <dds/network/peer_discovery.hpp>
#include <dds/network/peer_selection.hpp>
#include <dds/network/peer_transport.hpp>
#include <dds/retriever/content_retriever.hpp>
#include <dds/service/config.hpp>
#include <dds/service/dds_service.hpp>
#include <dds/service/publisher.hpp>

namespace dds::service {

  /**
   * Retrieval is local first: content whose manifest and chunks are all in
   * storage never touches the network, and a corrupted local copy is an
   * error rather than a reason to ask peers. Otherwise the first peer which
   * supplies the manifest also supplies every chunk, and the verified
   * result is cached locally.
   *
   * Discovery and transport may be null, the service then works offline
   */
  class DdsServiceImpl : public DdsService {
   public:
    DdsServiceImpl(std::shared_ptr<chunking::Chunker> chunker,
                   std::shared_ptr<storage::Storage> storage,
                   std::shared_ptr<originator::Originator> originator,
                   std::shared_ptr<network::PeerDiscovery> discovery,
                   std::shared_ptr<network::PeerTransport> transport,
                   std::shared_ptr<network::PeerSelectionStrategy> selection,
                   Config config);

    ~DdsServiceImpl() override = default;

    outcome::result<ContentHash> publish(BytesIn content) override;

    outcome::result<Bytes> retrieve(std::string_view manifest_id) override;

   private:
    /// @return content if everything is stored locally, nullopt if not
    outcome::result<std::optional<Bytes>> retrieveLocal(
        const ContentHash &manifest_id);

    outcome::result<Bytes> retrieveFromPeers(const ContentHash &manifest_id);

    /// Store fetched data, the manifest last
    outcome::result<void> cache(const chunking::Manifest &manifest,
                                const std::vector<chunking::Chunk> &chunks);

    std::shared_ptr<storage::Storage> storage_;
    std::shared_ptr<network::PeerDiscovery> discovery_;
    std::shared_ptr<network::PeerTransport> transport_;
    std::shared_ptr<network::PeerSelectionStrategy> selection_;
    Config config_;
    Publisher publisher_;
    retriever::ContentRetriever local_;
    log::Logger log_;
  };

}  // namespace dds::service
