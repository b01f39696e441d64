/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/network/message.hpp>

#include <algorithm>

#include <dds/codec/uvarint.hpp>

#include <generated/network/protobuf/dds.pb.h>

OUTCOME_CPP_DEFINE_CATEGORY(dds::network, MessageError, e) {
  using dds::network::MessageError;
  switch (e) {
    case MessageError::EMPTY_MESSAGE:
      return "empty message";
    case MessageError::UNKNOWN_TYPE:
      return "unknown message type";
    case MessageError::PARSE_FAILED:
      return "message cannot be parsed";
    case MessageError::BAD_HASH:
      return "hash field is not a SHA-256 digest";
    case MessageError::MISSING_MANIFEST:
      return "manifest response carries no manifest";
    case MessageError::SERIALIZE_FAILED:
      return "message cannot be serialized";
    case MessageError::BAD_VARINT:
      return "malformed varint in frame length";
    case MessageError::FRAME_TOO_LARGE:
      return "frame exceeds maximum message size";
  }
  return "unknown message error";
}

namespace dds::network {

  using chunking::Chunk;
  using chunking::Manifest;

  namespace {
    void assign_hash(std::string &dst, const ContentHash &src) {
      const auto &digest = src.digest();
      dst.assign(digest.begin(), digest.end());
    }

    outcome::result<ContentHash> read_hash(const std::string &src) {
      if (src.size() != common::kHash256Size) {
        return MessageError::BAD_HASH;
      }
      common::Hash256 digest{};
      std::copy(src.begin(), src.end(), digest.begin());
      return ContentHash::fromDigest(digest);
    }

    void assign_manifest(pb::Manifest &dst, const Manifest &src) {
      assign_hash(*dst.mutable_id(), src.id);
      assign_hash(*dst.mutable_content_id(), src.content_id);
      for (const auto &chunk_id : src.chunk_ids) {
        assign_hash(*dst.add_chunk_ids(), chunk_id);
      }
      dst.set_total_size(src.total_size);
    }

    outcome::result<Manifest> read_manifest(const pb::Manifest &src) {
      OUTCOME_TRY(id, read_hash(src.id()));
      OUTCOME_TRY(content_id, read_hash(src.content_id()));
      std::vector<ContentHash> chunk_ids;
      chunk_ids.reserve(src.chunk_ids_size());
      for (const auto &chunk_id : src.chunk_ids()) {
        OUTCOME_TRY(hash, read_hash(chunk_id));
        chunk_ids.push_back(std::move(hash));
      }
      return Manifest{std::move(id),
                      std::move(content_id),
                      std::move(chunk_ids),
                      src.total_size()};
    }

    outcome::result<Message> read_message(const pb::Message &src) {
      auto type = static_cast<int>(src.type());
      if (type < static_cast<int>(MessageType::GET_MANIFEST)
          or type > static_cast<int>(MessageType::ACK)) {
        return MessageError::UNKNOWN_TYPE;
      }
      switch (static_cast<MessageType>(type)) {
        case MessageType::GET_MANIFEST: {
          OUTCOME_TRY(id, read_hash(src.key()));
          return GetManifestRequest{std::move(id)};
        }
        case MessageType::GET_CHUNK: {
          OUTCOME_TRY(id, read_hash(src.key()));
          return GetChunkRequest{std::move(id)};
        }
        case MessageType::ADVERTISE: {
          OUTCOME_TRY(manifest_id, read_hash(src.key()));
          return AdvertiseNotice{
              std::move(manifest_id), src.node_id(), src.address()};
        }
        case MessageType::MANIFEST: {
          if (not src.has_manifest()) {
            return MessageError::MISSING_MANIFEST;
          }
          OUTCOME_TRY(manifest, read_manifest(src.manifest()));
          return ManifestResponse{std::move(manifest)};
        }
        case MessageType::CHUNK: {
          OUTCOME_TRY(id, read_hash(src.key()));
          Bytes data{src.data().begin(), src.data().end()};
          auto size = data.size();
          return ChunkResponse{Chunk{std::move(id), std::move(data), size}};
        }
        case MessageType::NOT_FOUND: {
          OUTCOME_TRY(id, read_hash(src.key()));
          return NotFoundResponse{std::move(id)};
        }
        case MessageType::ACK:
          return AckResponse{};
      }
      return MessageError::UNKNOWN_TYPE;
    }
  }  // namespace

  MessageType messageType(const Message &message) {
    return static_cast<MessageType>(message.index() + 1);
  }

  outcome::result<Bytes> encodeMessage(const Message &message) {
    pb::Message pb_msg;
    pb_msg.set_type(
        static_cast<pb::Message_MessageType>(messageType(message)));
    std::visit(
        [&](const auto &m) {
          using T = std::decay_t<decltype(m)>;
          if constexpr (std::is_same_v<T, GetManifestRequest>
                        or std::is_same_v<T, GetChunkRequest>
                        or std::is_same_v<T, NotFoundResponse>) {
            assign_hash(*pb_msg.mutable_key(), m.id);
          } else if constexpr (std::is_same_v<T, AdvertiseNotice>) {
            assign_hash(*pb_msg.mutable_key(), m.manifest_id);
            pb_msg.set_node_id(m.node_id);
            pb_msg.set_address(m.address);
          } else if constexpr (std::is_same_v<T, ManifestResponse>) {
            assign_manifest(*pb_msg.mutable_manifest(), m.manifest);
          } else if constexpr (std::is_same_v<T, ChunkResponse>) {
            assign_hash(*pb_msg.mutable_key(), m.chunk.id);
            pb_msg.set_data(m.chunk.data.data(), m.chunk.data.size());
          }
        },
        message);

    Bytes body(pb_msg.ByteSizeLong());
    if (not pb_msg.SerializeToArray(body.data(),
                                    static_cast<int>(body.size()))) {
      return MessageError::SERIALIZE_FAILED;
    }
    return body;
  }

  outcome::result<Message> decodeMessage(BytesIn body) {
    if (body.empty()) {
      return MessageError::EMPTY_MESSAGE;
    }
    pb::Message pb_msg;
    if (not pb_msg.ParseFromArray(body.data(),
                                  static_cast<int>(body.size()))) {
      return MessageError::PARSE_FAILED;
    }
    return read_message(pb_msg);
  }

  Bytes makeFrame(BytesIn body) {
    Bytes frame;
    frame.reserve(codec::kMaxVarintSize + body.size());
    codec::appendVarint(body.size(), frame);
    frame.insert(frame.end(), body.begin(), body.end());
    return frame;
  }

}  // namespace dds::network
