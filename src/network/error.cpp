/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/network/error.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(dds::network, NodeError, e) {
  using dds::network::NodeError;
  switch (e) {
    case NodeError::EMPTY_ADDRESS:
      return "node address cannot be empty";
  }
  return "unknown node error";
}

OUTCOME_CPP_DEFINE_CATEGORY(dds::network, DiscoveryError, e) {
  using dds::network::DiscoveryError;
  switch (e) {
    case DiscoveryError::UNAVAILABLE:
      return "peer discovery is unavailable";
  }
  return "unknown discovery error";
}

OUTCOME_CPP_DEFINE_CATEGORY(dds::network, TransportError, e) {
  using dds::network::TransportError;
  switch (e) {
    case TransportError::PEER_NOT_FOUND:
      return "peer is not reachable";
    case TransportError::MANIFEST_UNAVAILABLE:
      return "peer does not provide the manifest";
    case TransportError::CHUNK_UNAVAILABLE:
      return "peer does not provide the chunk";
    case TransportError::CONNECTION_FAILED:
      return "connection to peer failed";
    case TransportError::TIMEOUT:
      return "peer did not answer in time";
    case TransportError::MALFORMED_RESPONSE:
      return "peer answered with a malformed message";
    case TransportError::ADVERTISEMENT_FAILED:
      return "no peer accepted the advertisement";
  }
  return "unknown transport error";
}
