/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/content/content_hash.hpp>

#include <dds/common/hexutil.hpp>
#include <dds/crypto/sha256.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(dds::content, ContentHashError, e) {
  using dds::content::ContentHashError;
  switch (e) {
    case ContentHashError::SUCCESS:
      return "success";
    case ContentHashError::WRONG_LENGTH:
      return "content hash must be 64 hex characters long";
    case ContentHashError::NON_HEX_INPUT:
      return "content hash contains non-hex characters";
  }
  return "unknown error";
}

namespace dds::content {

  ContentHash::ContentHash(const common::Hash256 &digest)
      : digest_{digest}, hex_{common::hex_lower(digest)} {}

  ContentHash::FactoryResult ContentHash::compute(BytesIn data) {
    OUTCOME_TRY(digest, crypto::sha256(data));
    return fromDigest(digest);
  }

  ContentHash::FactoryResult ContentHash::compute(std::string_view data) {
    return compute(BytesIn{reinterpret_cast<const uint8_t *>(data.data()),
                           data.size()});
  }

  ContentHash::FactoryResult ContentHash::fromHex(std::string_view hex) {
    auto digest = common::unhexDigest(hex);
    if (digest.has_error()) {
      if (digest.error() == common::UnhexError::WRONG_LENGTH) {
        return ContentHashError::WRONG_LENGTH;
      }
      return ContentHashError::NON_HEX_INPUT;
    }
    return ContentHash{digest.value()};
  }

  ContentHash ContentHash::fromDigest(const common::Hash256 &digest) {
    return ContentHash{digest};
  }

  const std::string &ContentHash::toHex() const {
    return hex_;
  }

  const common::Hash256 &ContentHash::digest() const {
    return digest_;
  }

}  // namespace dds::content
