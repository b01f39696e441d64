/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <variant>

#include <dds/chunking/chunk.hpp>
#include <dds/network/node.hpp>

namespace dds::network {

  enum class MessageError {
    EMPTY_MESSAGE = 1,
    UNKNOWN_TYPE,
    PARSE_FAILED,
    BAD_HASH,
    MISSING_MANIFEST,
    SERIALIZE_FAILED,
    BAD_VARINT,
    FRAME_TOO_LARGE,
  };

  /**
   * Messages exchanged between nodes. Each one travels as a frame:
   *   uvarint(body length) | body
   * where body is a serialized dds.network.pb.Message (see
   * src/network/protobuf/dds.proto), tagged with one of these types
   */
  enum class MessageType : uint8_t {
    GET_MANIFEST = 1,
    GET_CHUNK = 2,
    ADVERTISE = 3,
    MANIFEST = 4,
    CHUNK = 5,
    NOT_FOUND = 6,
    ACK = 7,
  };

  struct GetManifestRequest {
    ContentHash id;
    bool operator==(const GetManifestRequest &) const = default;
  };

  struct GetChunkRequest {
    ContentHash id;
    bool operator==(const GetChunkRequest &) const = default;
  };

  /// Fire-and-forget announcement that the sender serves a manifest
  struct AdvertiseNotice {
    ContentHash manifest_id;
    std::string node_id;
    std::string address;
    bool operator==(const AdvertiseNotice &) const = default;
  };

  struct ManifestResponse {
    chunking::Manifest manifest;
    bool operator==(const ManifestResponse &) const = default;
  };

  struct ChunkResponse {
    chunking::Chunk chunk;
    bool operator==(const ChunkResponse &) const = default;
  };

  struct NotFoundResponse {
    ContentHash id;
    bool operator==(const NotFoundResponse &) const = default;
  };

  struct AckResponse {
    bool operator==(const AckResponse &) const = default;
  };

  using Message = std::variant<GetManifestRequest,
                               GetChunkRequest,
                               AdvertiseNotice,
                               ManifestResponse,
                               ChunkResponse,
                               NotFoundResponse,
                               AckResponse>;

  MessageType messageType(const Message &message);

  /// Serialize message body, without the length prefix
  outcome::result<Bytes> encodeMessage(const Message &message);

  /// Parse message body; hashes must be 32-byte digests
  outcome::result<Message> decodeMessage(BytesIn body);

  /// Prefix body with its length
  Bytes makeFrame(BytesIn body);

}  // namespace dds::network

OUTCOME_HPP_DECLARE_ERROR(dds::network, MessageError)
