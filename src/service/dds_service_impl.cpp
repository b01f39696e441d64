/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/service/dds_service_impl.hpp>

#include <dds/retriever/peer_retriever.hpp>
#include <dds/retriever/storage_retriever.hpp>
#include <dds/service/content_verifier.hpp>

namespace dds::service {

  DdsServiceImpl::DdsServiceImpl(
      std::shared_ptr<chunking::Chunker> chunker,
      std::shared_ptr<storage::Storage> storage,
      std::shared_ptr<originator::Originator> originator,
      std::shared_ptr<network::PeerDiscovery> discovery,
      std::shared_ptr<network::PeerTransport> transport,
      std::shared_ptr<network::PeerSelectionStrategy> selection,
      Config config)
      : storage_{storage},
        discovery_{std::move(discovery)},
        transport_{std::move(transport)},
        selection_{selection ? std::move(selection)
                             : std::make_shared<network::DiscoveryOrder>()},
        config_{std::move(config)},
        publisher_{std::move(chunker), storage, std::move(originator)},
        local_{std::make_shared<retriever::StorageRetriever>(storage)},
        log_{log::createLogger("DdsService")} {}

  outcome::result<ContentHash> DdsServiceImpl::publish(BytesIn content) {
    OUTCOME_TRY(manifest_id, publisher_.publishContent(content));

    if (transport_) {
      auto advertised = transport_->advertiseContent(manifest_id);
      if (advertised.has_error()) {
        log_->warn("cannot advertise {}: {}", manifest_id, advertised.error());
      }
    }
    return manifest_id;
  }

  outcome::result<Bytes> DdsServiceImpl::retrieve(
      std::string_view manifest_id) {
    if (manifest_id.empty()) {
      return ServiceError::EMPTY_MANIFEST_ID;
    }
    auto id = ContentHash::fromHex(manifest_id);
    if (id.has_error()) {
      return ServiceError::INVALID_MANIFEST_ID;
    }

    log_->debug("{}: local lookup", id.value());
    OUTCOME_TRY(local, retrieveLocal(id.value()));
    if (local) {
      log_->info("retrieved {} from local storage", id.value());
      return std::move(*local);
    }

    if (not discovery_ or not transport_) {
      return ServiceError::NETWORK_NOT_CONFIGURED;
    }
    return retrieveFromPeers(id.value());
  }

  outcome::result<std::optional<Bytes>> DdsServiceImpl::retrieveLocal(
      const ContentHash &manifest_id) {
    auto parts = local_.fetchParts(manifest_id);
    if (parts.has_error()) {
      if (storage::isNotFound(parts.error())) {
        log_->debug("{}: not complete locally ({})",
                    manifest_id,
                    parts.error());
        return std::nullopt;
      }
      return parts.error();
    }

    log_->debug("{}: local verify", manifest_id);
    auto &[manifest, chunks] = parts.value();
    auto content = verifyContent(manifest, chunks);
    if (content.has_error()) {
      log_->error("local copy of {} is corrupted: {}",
                  manifest_id,
                  content.error());
      return content.error();
    }
    return std::move(content.value());
  }

  outcome::result<Bytes> DdsServiceImpl::retrieveFromPeers(
      const ContentHash &manifest_id) {
    log_->debug("{}: peer discovery", manifest_id);
    OUTCOME_TRY(discovered, discovery_->discoverPeers());
    if (discovered.empty()) {
      return ServiceError::NO_PEERS;
    }
    auto peers = selection_->order(std::move(discovered));

    log_->debug("{}: manifest fetch from {} peers", manifest_id, peers.size());
    std::optional<retriever::PeerRetriever> source;
    std::optional<chunking::Manifest> manifest;
    for (auto &peer : peers) {
      retriever::PeerRetriever retriever{
          transport_, std::move(peer), config_.requestTimeout};
      auto fetched = retriever.fetchManifest(manifest_id);
      if (fetched.has_error()) {
        log_->debug("{} cannot supply {}: {}",
                    retriever.peer().address(),
                    manifest_id,
                    fetched.error());
        continue;
      }
      source.emplace(std::move(retriever));
      manifest.emplace(std::move(fetched.value()));
      break;
    }
    if (not source) {
      return ServiceError::MANIFEST_UNAVAILABLE;
    }

    log_->debug("{}: chunk fetch from {}",
                manifest_id,
                source->peer().address());
    std::vector<chunking::Chunk> chunks;
    chunks.reserve(manifest->chunk_ids.size());
    for (const auto &chunk_id : manifest->chunk_ids) {
      auto chunk = source->fetchChunk(chunk_id);
      if (chunk.has_error()) {
        log_->warn("{} failed to supply chunk {}: {}",
                   source->peer().address(),
                   chunk_id,
                   chunk.error());
        return ServiceError::CHUNK_FETCH_FAILED;
      }
      chunks.push_back(std::move(chunk.value()));
    }

    log_->debug("{}: network verify", manifest_id);
    if (manifest->id != manifest_id) {
      return ServiceError::INTEGRITY_ERROR;
    }
    auto content = verifyContent(*manifest, chunks);
    if (content.has_error()) {
      log_->error("{} supplied invalid data for {}: {}",
                  source->peer().address(),
                  manifest_id,
                  content.error());
      return content.error();
    }

    auto cached = cache(*manifest, chunks);
    if (cached.has_error()) {
      log_->warn("{}: {}", manifest_id, cached.error());
    }
    log_->info("retrieved {} from {}", manifest_id, source->peer().address());
    return std::move(content.value());
  }

  outcome::result<void> DdsServiceImpl::cache(
      const chunking::Manifest &manifest,
      const std::vector<chunking::Chunk> &chunks) {
    for (const auto &chunk : chunks) {
      auto stored = storage_->storeChunk(chunk);
      if (stored.has_error()) {
        log_->warn("cannot cache chunk {}: {}", chunk.id, stored.error());
        return ServiceError::CACHE_FAILED;
      }
    }
    auto stored = storage_->storeManifest(manifest);
    if (stored.has_error()) {
      log_->warn("cannot cache manifest {}: {}", manifest.id, stored.error());
      return ServiceError::CACHE_FAILED;
    }
    return outcome::success();
  }

}  // namespace dds::service
