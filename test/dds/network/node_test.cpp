/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/network/node.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <dds/network/error.hpp>
#include "mock/dds/crypto/random_source_mock.hpp"
#include "testutil/outcome.hpp"

using dds::content::ContentHash;
using dds::crypto::random::RandomSourceMock;
using dds::network::Node;
using dds::network::NodeError;
using ::testing::_;
using ::testing::Invoke;

class NodeTest : public ::testing::Test {
 public:
  ContentHash first = ContentHash::compute(std::string_view{"first"}).value();
  ContentHash second = ContentHash::compute(std::string_view{"second"}).value();
  RandomSourceMock random;
};

/**
 * @given a random source
 * @when creating a node
 * @then its id is the hex rendering of 16 random bytes, other fields are as
 * given
 */
TEST_F(NodeTest, CreateGeneratesId) {
  EXPECT_CALL(random, fill(_)).WillOnce(Invoke([](dds::BytesOut out) {
    ASSERT_EQ(out.size(), Node::kIdLength);
    std::fill(out.begin(), out.end(), 0xAB);
  }));

  EXPECT_OUTCOME_TRUE(node, Node::create("127.0.0.1:4001", 7, random));
  ASSERT_EQ(node.id(), "abababababababababababababababab");
  ASSERT_EQ(node.address(), "127.0.0.1:4001");
  ASSERT_EQ(node.reputationScore(), 7);
  ASSERT_TRUE(node.knownContent().empty());
}

/**
 * @given an empty address
 * @when creating a node
 * @then creation fails
 */
TEST_F(NodeTest, CreateRejectsEmptyAddress) {
  EXPECT_EC(Node::create("", 0, random), NodeError::EMPTY_ADDRESS);
}

/**
 * @given a node
 * @when the same content is advertised twice
 * @then it is listed once, in the order of first advertisement
 */
TEST_F(NodeTest, AddAdvertisedContentIsIdempotent) {
  Node node{"id", "127.0.0.1:1", 0};
  node.addAdvertisedContent(first);
  node.addAdvertisedContent(second);
  node.addAdvertisedContent(first);

  ASSERT_EQ(node.knownContent(), (std::vector<ContentHash>{first, second}));
  ASSERT_TRUE(node.advertises(first));
  ASSERT_TRUE(node.advertises(second));
}

/**
 * @given a node
 * @when rendering it as a string
 * @then a short description is produced
 */
TEST_F(NodeTest, ToString) {
  Node node{"0123456789abcdef", "10.0.0.1:5000", 42};
  node.addAdvertisedContent(first);
  ASSERT_EQ(node.toString(),
            "Node{ID: 01234567..., Address: 10.0.0.1:5000, Reputation: 42, "
            "KnownContentCount: 1}");
  ASSERT_EQ(fmt::format("{}", node), node.toString());
}
