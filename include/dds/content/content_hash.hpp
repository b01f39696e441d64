/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include <dds/common/types.hpp>
#include <dds/outcome/outcome.hpp>

namespace dds::content {

  enum class ContentHashError { SUCCESS = 0, WRONG_LENGTH, NON_HEX_INPUT };

  /**
   * Address of a piece of data: SHA-256 digest of the raw bytes rendered as
   * lowercase hex. Chunks, manifests and whole contents share this scheme
   */
  class ContentHash {
    using FactoryResult = outcome::result<ContentHash>;

   public:
    ContentHash(const ContentHash &other) = default;
    ContentHash &operator=(const ContentHash &other) = default;
    ContentHash(ContentHash &&other) noexcept = default;
    ContentHash &operator=(ContentHash &&other) noexcept = default;
    ~ContentHash() = default;

    /// Number of hex characters in a rendered hash
    static constexpr size_t kHexLength = 64;

    /**
     * Hash the data
     * @param data to be addressed
     * @return address of the data
     */
    static FactoryResult compute(BytesIn data);

    /**
     * Hash a string, taking its characters as raw bytes
     */
    static FactoryResult compute(std::string_view data);

    /**
     * Parse a rendered hash. Both cases are accepted, the stored form is
     * lowercase
     * @param hex - 64 hex digits
     */
    static FactoryResult fromHex(std::string_view hex);

    /// Wrap an already computed digest
    static ContentHash fromDigest(const common::Hash256 &digest);

    const std::string &toHex() const;

    const common::Hash256 &digest() const;

    bool operator==(const ContentHash &other) const = default;
    auto operator<=>(const ContentHash &other) const = default;

   private:
    explicit ContentHash(const common::Hash256 &digest);

    common::Hash256 digest_;
    std::string hex_;
  };

}  // namespace dds::content

namespace std {
  template <>
  struct hash<dds::content::ContentHash> {
    size_t operator()(const dds::content::ContentHash &h) const {
      return std::hash<std::string>()(h.toHex());
    }
  };
}  // namespace std

template <>
struct fmt::formatter<dds::content::ContentHash> {
  // Presentation format: 's' - short, 'l' - long.
  char presentation = 's';

  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin(), end = ctx.end();
    if (it != end && (*it == 's' || *it == 'l')) {
      presentation = *it++;
    }

    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }

    return it;
  }

  template <typename FormatContext>
  auto format(const dds::content::ContentHash &hash, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    const auto &hex = hash.toHex();

    if (presentation == 's') {
      auto out = std::copy_n(hex.begin(), 8, ctx.out());
      static constexpr string_view ellipsis("...");
      return std::copy(ellipsis.begin(), ellipsis.end(), out);
    }

    return std::copy(hex.begin(), hex.end(), ctx.out());
  }
};

OUTCOME_HPP_DECLARE_ERROR(dds::content, ContentHashError)
