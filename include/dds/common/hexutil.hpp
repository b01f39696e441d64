/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include <boost/algorithm/hex.hpp>

#include <dds/common/types.hpp>
#include <dds/outcome/outcome.hpp>

namespace dds::common {

  enum class UnhexError {
    WRONG_LENGTH = 1,  ///< not exactly two characters per digest byte
    NON_HEX_INPUT,
  };

  /// Lowercase hex rendering of @param bytes
  inline std::string hex_lower(BytesIn bytes) noexcept {
    std::string res(bytes.size() * 2, '\x00');
    boost::algorithm::hex_lower(bytes.begin(), bytes.end(), res.begin());
    return res;
  }

  /**
   * Decode a rendered SHA-256 digest
   * @param hex 64 hex characters, either case
   * @return digest bytes
   */
  outcome::result<Hash256> unhexDigest(std::string_view hex);

}  // namespace dds::common

OUTCOME_HPP_DECLARE_ERROR(dds::common, UnhexError);
