/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <dds/outcome/outcome.hpp>

namespace dds::network {

  enum class NodeError {
    EMPTY_ADDRESS = 1,
  };

  enum class DiscoveryError {
    UNAVAILABLE = 1,  ///< discovery mechanism cannot be queried
  };

  enum class TransportError {
    PEER_NOT_FOUND = 1,    ///< peer address cannot be resolved or reached
    MANIFEST_UNAVAILABLE,  ///< peer does not serve the manifest
    CHUNK_UNAVAILABLE,     ///< peer does not serve the chunk
    CONNECTION_FAILED,     ///< exchange broke after connecting
    TIMEOUT,               ///< peer did not answer before the deadline
    MALFORMED_RESPONSE,    ///< peer answered with an unexpected message
    ADVERTISEMENT_FAILED,  ///< no known peer accepted an advertisement
  };

}  // namespace dds::network

OUTCOME_HPP_DECLARE_ERROR(dds::network, NodeError)
OUTCOME_HPP_DECLARE_ERROR(dds::network, DiscoveryError)
OUTCOME_HPP_DECLARE_ERROR(dds::network, TransportError)
