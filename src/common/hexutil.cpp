/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/common/hexutil.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(dds::common, UnhexError, e) {
  using dds::common::UnhexError;
  switch (e) {
    case UnhexError::WRONG_LENGTH:
      return "Digest must be rendered as 64 hex characters";
    case UnhexError::NON_HEX_INPUT:
      return "Input contains non-hex characters";
  }
  return "Unknown error";
}

namespace dds::common {

  outcome::result<Hash256> unhexDigest(std::string_view hex) {
    Hash256 digest{};
    if (hex.size() != digest.size() * 2) {
      return UnhexError::WRONG_LENGTH;
    }
    try {
      boost::algorithm::unhex(hex.begin(), hex.end(), digest.begin());
    } catch (const boost::algorithm::hex_decode_error &) {
      return UnhexError::NON_HEX_INPUT;
    }
    return digest;
  }

}  // namespace dds::common
