/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/content/content_hash.hpp>

#include <algorithm>
#include <unordered_set>

#include <gtest/gtest.h>

#include "testutil/bytes.hpp"
#include "testutil/outcome.hpp"

using dds::content::ContentHash;
using dds::content::ContentHashError;

namespace {
  constexpr auto kHelloHash =
      "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824";
}

/**
 * @given some bytes
 * @when computing their content hash
 * @then it is the lowercase hex SHA-256 of the bytes
 */
TEST(ContentHashTest, ComputeIsLowercaseSha256) {
  EXPECT_OUTCOME_TRUE(hash, ContentHash::compute(testutil::bytes("hello")));
  ASSERT_EQ(hash.toHex(), kHelloHash);
  ASSERT_EQ(hash.toHex().size(), ContentHash::kHexLength);

  EXPECT_OUTCOME_TRUE(same, ContentHash::compute(std::string_view{"hello"}));
  ASSERT_EQ(hash, same);
}

/**
 * @given a rendered hash in upper case
 * @when parsing it
 * @then it equals the computed hash, rendered in lower case
 */
TEST(ContentHashTest, FromHexNormalisesCase) {
  std::string upper(kHelloHash);
  std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
  EXPECT_OUTCOME_TRUE(parsed, ContentHash::fromHex(upper));
  ASSERT_EQ(parsed.toHex(), kHelloHash);
}

/**
 * @given strings which are not rendered hashes
 * @when parsing them
 * @then the proper error is reported
 */
TEST(ContentHashTest, FromHexRejectsMalformed) {
  EXPECT_EC(ContentHash::fromHex(""), ContentHashError::WRONG_LENGTH);
  EXPECT_EC(ContentHash::fromHex("abc"), ContentHashError::WRONG_LENGTH);

  std::string bad(kHelloHash);
  bad[10] = 'z';
  EXPECT_EC(ContentHash::fromHex(bad), ContentHashError::NON_HEX_INPUT);
}

/**
 * @given two different contents
 * @when hashing them
 * @then the hashes differ and are usable as unordered keys
 */
TEST(ContentHashTest, DistinctContentDistinctHash) {
  EXPECT_OUTCOME_TRUE(a, ContentHash::compute(testutil::bytes("a")));
  EXPECT_OUTCOME_TRUE(b, ContentHash::compute(testutil::bytes("b")));
  ASSERT_NE(a, b);

  std::unordered_set<ContentHash> set{a, b, a};
  ASSERT_EQ(set.size(), 2);
}

/**
 * @given a hash
 * @when formatting it
 * @then short form keeps the first 8 characters, long form all of them
 */
TEST(ContentHashTest, Format) {
  EXPECT_OUTCOME_TRUE(hash, ContentHash::fromHex(kHelloHash));
  ASSERT_EQ(fmt::format("{}", hash), "2cf24dba...");
  ASSERT_EQ(fmt::format("{:l}", hash), kHelloHash);
}
