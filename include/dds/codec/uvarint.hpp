/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <dds/common/types.hpp>
#include <dds/outcome/outcome.hpp>

namespace dds::codec {

  enum class VarintError {
    INCOMPLETE = 1,  ///< input ends inside the varint
    TOO_LONG,        ///< value does not fit into 64 bits
  };

  /// Longest LEB128 encoding of a 64-bit number
  constexpr size_t kMaxVarintSize = 10;

  struct DecodedVarint {
    uint64_t value = 0;
    /// bytes consumed from the input
    size_t size = 0;
  };

  /// Append unsigned LEB128 encoding of @param value to @param out
  void appendVarint(uint64_t value, Bytes &out);

  Bytes encodeVarint(uint64_t value);

  /**
   * Decode the varint at the beginning of @param in, the rest of the input
   * is ignored
   */
  outcome::result<DecodedVarint> decodeVarint(BytesIn in);

}  // namespace dds::codec

OUTCOME_HPP_DECLARE_ERROR(dds::codec, VarintError)
