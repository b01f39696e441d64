/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace dds::service {

  using namespace std::chrono_literals;

  class Config {
   public:
    Config() = default;

    /**
     * Size of chunks produced on publish, the last one may be shorter.
     * Zero means default
     * @note Default: 1KiB
     */
    size_t chunkSize = 1024;

    /**
     * Bound on a single manifest or chunk request to a peer. A peer which
     * does not answer in time is treated as failed
     * @note Default: 10s
     */
    std::chrono::milliseconds requestTimeout = 10s;

    /**
     * Bound on delivering an advertisement to one peer
     * @note Default: 3s
     */
    std::chrono::milliseconds connectionTimeout = 3s;

    /**
     * Endpoint to serve other nodes on, port 0 picks a free one
     * @note Default: "127.0.0.1:0"
     */
    std::string listenAddress = "127.0.0.1:0";

    /**
     * Peers known before any advertisement arrives, as "host:port"
     */
    std::vector<std::string> bootstrapPeers;

    /**
     * Reputation announced for the local node
     * @note Default: 100
     */
    int localReputation = 100;

    /**
     * Frames with a longer body are rejected
     * @note Default: 16MiB
     */
    size_t maxMessageSize = 16 * 1024 * 1024;

    /**
     * SQLite database file. Empty keeps everything in memory
     */
    std::string storagePath;
  };

}  // namespace dds::service
