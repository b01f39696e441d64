/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/crypto/sha256.hpp>

#include <gtest/gtest.h>

#include <dds/common/hexutil.hpp>
#include <dds/crypto/error.hpp>
#include "testutil/bytes.hpp"
#include "testutil/outcome.hpp"

using dds::common::hex_lower;
using dds::crypto::Sha256Hasher;
using dds::crypto::sha256;

/**
 * @given a text
 * @when hashing it in one go
 * @then the well-known SHA-256 digest is produced
 */
TEST(Sha256Test, HashesText) {
  EXPECT_OUTCOME_TRUE(digest, sha256(testutil::bytes("hello")));
  ASSERT_EQ(
      hex_lower(digest),
      "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");
}

/**
 * @given empty input
 * @when hashing it
 * @then digest of the empty string is produced
 */
TEST(Sha256Test, HashesEmptyInput) {
  EXPECT_OUTCOME_TRUE(digest, sha256(dds::BytesIn{}));
  ASSERT_EQ(
      hex_lower(digest),
      "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

/**
 * @given a hasher fed in two parts
 * @when taking the digest
 * @then it equals the one-shot digest of the concatenation
 */
TEST(Sha256Test, IncrementalUpdate) {
  Sha256Hasher hasher;
  EXPECT_OUTCOME_TRUE_1(hasher.update(testutil::bytes("hel")));
  EXPECT_OUTCOME_TRUE_1(hasher.update(std::string_view{"lo"}));
  EXPECT_OUTCOME_TRUE(digest, hasher.finish());

  EXPECT_OUTCOME_TRUE(expected, sha256(testutil::bytes("hello")));
  ASSERT_EQ(digest, expected);
}

/**
 * @given a hasher whose digest was taken
 * @when using it again
 * @then ALREADY_FINISHED is returned
 */
TEST(Sha256Test, SingleUse) {
  Sha256Hasher hasher;
  EXPECT_OUTCOME_TRUE_1(hasher.finish());
  EXPECT_EC(hasher.update(std::string_view{"more"}),
            dds::crypto::HashError::ALREADY_FINISHED);
  EXPECT_EC(hasher.finish(), dds::crypto::HashError::ALREADY_FINISHED);
}

/**
 * @given a hasher without a digest implementation, so it never initialized
 * @when using it
 * @then CONTEXT_UNAVAILABLE is returned rather than ALREADY_FINISHED
 */
TEST(Sha256Test, UninitializedHasher) {
  Sha256Hasher hasher{nullptr};
  EXPECT_EC(hasher.update(std::string_view{"data"}),
            dds::crypto::HashError::CONTEXT_UNAVAILABLE);
  EXPECT_EC(hasher.finish(), dds::crypto::HashError::CONTEXT_UNAVAILABLE);
}
