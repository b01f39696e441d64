/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/codec/uvarint.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(dds::codec, VarintError, e) {
  using dds::codec::VarintError;
  switch (e) {
    case VarintError::INCOMPLETE:
      return "varint is not terminated";
    case VarintError::TOO_LONG:
      return "varint exceeds 64 bits";
  }
  return "unknown varint error";
}

namespace dds::codec {

  void appendVarint(uint64_t value, Bytes &out) {
    while (value >= 0x80) {
      out.push_back(static_cast<uint8_t>(value) | 0x80);
      value >>= 7;
    }
    out.push_back(static_cast<uint8_t>(value));
  }

  Bytes encodeVarint(uint64_t value) {
    Bytes out;
    out.reserve(kMaxVarintSize);
    appendVarint(value, out);
    return out;
  }

  outcome::result<DecodedVarint> decodeVarint(BytesIn in) {
    DecodedVarint decoded;
    size_t shift = 0;
    for (auto byte : in) {
      uint64_t slice = byte & 0x7f;
      // the tenth byte may only carry the single top bit
      if (shift >= 64 or (slice << shift >> shift) != slice) {
        return VarintError::TOO_LONG;
      }
      decoded.value |= slice << shift;
      ++decoded.size;
      if ((byte & 0x80) == 0) {
        return decoded;
      }
      shift += 7;
    }
    return VarintError::INCOMPLETE;
  }

}  // namespace dds::codec
