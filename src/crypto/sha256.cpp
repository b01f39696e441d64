/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/crypto/sha256.hpp>

#include <dds/crypto/error.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(dds::crypto, HashError, e) {
  using dds::crypto::HashError;
  switch (e) {
    case HashError::CONTEXT_UNAVAILABLE:
      return "Cannot create SHA-256 context";
    case HashError::UPDATE_FAILED:
      return "Cannot update SHA-256 digest";
    case HashError::FINALIZE_FAILED:
      return "Cannot finalize SHA-256 digest";
    case HashError::ALREADY_FINISHED:
      return "SHA-256 digest was already taken";
  }
  return "Unknown hash error";
}

namespace dds::crypto {

  Sha256Hasher::Sha256Hasher(const EVP_MD *md) : ctx_{EVP_MD_CTX_new()} {
    if (ctx_ != nullptr and md != nullptr
        and 1 == EVP_DigestInit_ex(ctx_.get(), md, nullptr)) {
      state_ = State::kReady;
    }
  }

  outcome::result<void> Sha256Hasher::update(BytesIn data) {
    if (state_ == State::kUnavailable) {
      return HashError::CONTEXT_UNAVAILABLE;
    }
    if (state_ == State::kFinished) {
      return HashError::ALREADY_FINISHED;
    }
    if (1 != EVP_DigestUpdate(ctx_.get(), data.data(), data.size())) {
      return HashError::UPDATE_FAILED;
    }
    return outcome::success();
  }

  outcome::result<void> Sha256Hasher::update(std::string_view text) {
    return update(
        BytesIn{reinterpret_cast<const uint8_t *>(text.data()), text.size()});
  }

  outcome::result<common::Hash256> Sha256Hasher::finish() {
    if (state_ == State::kUnavailable) {
      return HashError::CONTEXT_UNAVAILABLE;
    }
    if (state_ == State::kFinished) {
      return HashError::ALREADY_FINISHED;
    }
    state_ = State::kFinished;
    common::Hash256 digest{};
    unsigned int size = 0;
    if (1 != EVP_DigestFinal_ex(ctx_.get(), digest.data(), &size)
        or size != digest.size()) {
      return HashError::FINALIZE_FAILED;
    }
    return digest;
  }

  outcome::result<common::Hash256> sha256(BytesIn input) {
    Sha256Hasher hasher;
    OUTCOME_TRY(hasher.update(input));
    return hasher.finish();
  }

}  // namespace dds::crypto
