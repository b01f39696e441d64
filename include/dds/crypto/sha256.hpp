/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string_view>

#include <openssl/evp.h>

#include <dds/common/types.hpp>
#include <dds/outcome/outcome.hpp>

namespace dds::crypto {

  /**
   * Streaming SHA-256. Feed data with update(), take the digest once with
   * finish()
   */
  class Sha256Hasher {
   public:
    /**
     * @param md - SHA-256 implementation, such as one fetched from a
     * specific provider; without a usable one every call fails with
     * HashError::CONTEXT_UNAVAILABLE
     */
    explicit Sha256Hasher(const EVP_MD *md = EVP_sha256());

    outcome::result<void> update(BytesIn data);

    /// Characters of @param text are hashed as raw bytes
    outcome::result<void> update(std::string_view text);

    outcome::result<common::Hash256> finish();

   private:
    struct CtxDeleter {
      void operator()(EVP_MD_CTX *ctx) const {
        EVP_MD_CTX_free(ctx);
      }
    };

    enum class State {
      kUnavailable,
      kReady,
      kFinished,
    };

    std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
    State state_ = State::kUnavailable;
  };

  /// One-shot SHA-256 of @param input
  outcome::result<common::Hash256> sha256(BytesIn input);

}  // namespace dds::crypto
