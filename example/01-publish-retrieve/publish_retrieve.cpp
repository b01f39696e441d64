/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include <dds/host/dds_host.hpp>
#include <dds/log/logger.hpp>
#include <dds/storage/in_memory_storage.hpp>

int main(int argc, char *argv[]) {
  std::string message("Hello, decentralized world!");
  if (argc > 1) {
    message = argv[1];
  }

  dds::log::setLevel(dds::log::Level::info);
  if (std::getenv("TRACE_DEBUG") != nullptr) {
    dds::log::setLevel(dds::log::Level::debug);
  }
  auto log = dds::log::createLogger("PublishRetrieve");

  dds::service::Config seed_config;
  seed_config.chunkSize = 10;
  auto seed = dds::host::DdsHost::create(
      seed_config, std::make_shared<dds::storage::InMemoryStorage>());
  if (not seed) {
    log->error("cannot start seeding node: {}", seed.error());
    return EXIT_FAILURE;
  }

  // the fetching node only knows the seed by address
  dds::service::Config fetch_config;
  fetch_config.bootstrapPeers = {seed.value()->listenAddress()};
  auto fetcher = dds::host::DdsHost::create(
      fetch_config, std::make_shared<dds::storage::InMemoryStorage>());
  if (not fetcher) {
    log->error("cannot start fetching node: {}", fetcher.error());
    return EXIT_FAILURE;
  }

  auto manifest_id = seed.value()->service().publish(dds::BytesIn{
      reinterpret_cast<const uint8_t *>(message.data()), message.size()});
  if (not manifest_id) {
    log->error("publish failed: {}", manifest_id.error());
    return EXIT_FAILURE;
  }
  log->info("{} published as {:l}",
            seed.value()->localNode(),
            manifest_id.value());

  auto content =
      fetcher.value()->service().retrieve(manifest_id.value().toHex());
  if (not content) {
    log->error("retrieve failed: {}", content.error());
    return EXIT_FAILURE;
  }

  std::string retrieved(content.value().begin(), content.value().end());
  std::cout << retrieved << std::endl;
  return retrieved == message ? EXIT_SUCCESS : EXIT_FAILURE;
}
