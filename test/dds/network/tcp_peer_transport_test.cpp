/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/network/tcp_peer_transport.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <fmt/format.h>
#include <gtest/gtest.h>

#include <dds/network/bootstrap_peer_discovery.hpp>
#include <dds/network/error.hpp>
#include <dds/network/peer_server.hpp>
#include <dds/network/tcp_util.hpp>
#include <dds/storage/in_memory_storage.hpp>
#include "testutil/dds/content.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace dds::network;
using dds::storage::InMemoryStorage;
using namespace std::chrono_literals;

class TcpPeerTransportTest : public ::testing::Test {
 public:
  void SetUp() override {
    testutil::prepareLoggers();

    for (const auto &chunk : content.chunks) {
      ASSERT_TRUE(server_storage->storeChunk(chunk));
    }
    ASSERT_TRUE(server_storage->storeManifest(content.manifest));

    server = std::make_unique<PeerServer>(
        server_storage,
        [this](const Node &advertiser, const ContentHash &id) {
          server_discovery->recordAdvertisement(advertiser, id);
        },
        TcpPeerTransport::Config{}.max_message_size);
    ASSERT_TRUE(server->listen("127.0.0.1:0"));
    server_peer = Node{"server", server->listenAddress().value(), 0};

    client_discovery = std::make_shared<BootstrapPeerDiscovery>(
        std::vector<std::string>{server_peer->address()});
    transport = std::make_shared<TcpPeerTransport>(
        Node{"client", "127.0.0.1:1", 0},
        client_discovery,
        TcpPeerTransport::Config{});
  }

  void TearDown() override {
    server->stop();
  }

  testutil::Content content =
      testutil::makeContent("content served over tcp by a peer", 8);
  std::shared_ptr<InMemoryStorage> server_storage =
      std::make_shared<InMemoryStorage>();
  std::shared_ptr<BootstrapPeerDiscovery> server_discovery =
      std::make_shared<BootstrapPeerDiscovery>(std::vector<std::string>{});
  std::unique_ptr<PeerServer> server;
  std::optional<Node> server_peer;

  std::shared_ptr<BootstrapPeerDiscovery> client_discovery;
  std::shared_ptr<TcpPeerTransport> transport;
};

/**
 * @given a peer serving stored content
 * @when requesting its manifest and chunks
 * @then they are returned as stored
 */
TEST_F(TcpPeerTransportTest, FetchesManifestAndChunks) {
  EXPECT_OUTCOME_TRUE(
      manifest,
      transport->requestManifest(*server_peer, content.manifest.id, 5s));
  ASSERT_EQ(manifest, content.manifest);

  for (const auto &expected : content.chunks) {
    EXPECT_OUTCOME_TRUE(chunk,
                        transport->requestChunk(*server_peer, expected.id, 5s));
    ASSERT_EQ(chunk, expected);
  }
}

/**
 * @given a peer which does not have the requested data
 * @when requesting it
 * @then unavailability is reported
 */
TEST_F(TcpPeerTransportTest, MissingData) {
  auto other = testutil::makeContent("not served");
  EXPECT_EC(transport->requestManifest(*server_peer, other.manifest.id, 5s),
            TransportError::MANIFEST_UNAVAILABLE);
  EXPECT_EC(transport->requestChunk(*server_peer, other.chunks[0].id, 5s),
            TransportError::CHUNK_UNAVAILABLE);
}

/**
 * @given peers with an unparsable address and with a closed port
 * @when requesting from them
 * @then the peer is reported as not found
 */
TEST_F(TcpPeerTransportTest, UnreachablePeer) {
  Node malformed{"bad", "not an address", 0};
  EXPECT_EC(transport->requestManifest(malformed, content.manifest.id, 1s),
            TransportError::PEER_NOT_FOUND);

  std::string closed_address;
  {
    boost::asio::io_context context;
    boost::asio::ip::tcp::acceptor acceptor{
        context, {boost::asio::ip::make_address("127.0.0.1"), 0}};
    closed_address = detail::makeAddress(acceptor.local_endpoint());
  }
  Node closed{"closed", closed_address, 0};
  EXPECT_EC(transport->requestManifest(closed, content.manifest.id, 1s),
            TransportError::PEER_NOT_FOUND);
}

/**
 * @given a peer which accepts connections but never answers
 * @when requesting from it with a short timeout
 * @then the request times out instead of hanging
 */
TEST_F(TcpPeerTransportTest, SilentPeerTimesOut) {
  boost::asio::io_context context;
  boost::asio::ip::tcp::acceptor acceptor{
      context, {boost::asio::ip::make_address("127.0.0.1"), 0}};
  Node silent{"silent", detail::makeAddress(acceptor.local_endpoint()), 0};

  auto started = std::chrono::steady_clock::now();
  EXPECT_EC(transport->requestManifest(silent, content.manifest.id, 200ms),
            TransportError::TIMEOUT);
  ASSERT_LT(std::chrono::steady_clock::now() - started, 5s);
}

/**
 * @given a peer known by host name
 * @when requesting from it
 * @then the name is resolved and the data is fetched
 */
TEST_F(TcpPeerTransportTest, FetchesFromNamedPeer) {
  EXPECT_OUTCOME_TRUE(port, detail::splitAddress(server_peer->address()));
  Node named{"named", fmt::format("localhost:{}", port.port), 0};
  EXPECT_OUTCOME_TRUE(
      manifest, transport->requestManifest(named, content.manifest.id, 5s));
  ASSERT_EQ(manifest, content.manifest);
}

/**
 * @given a peer whose host name needs a lookup
 * @when requesting from it with a deadline shorter than any lookup
 * @then the call returns within the deadline, and the transport still
 * serves later requests
 */
TEST_F(TcpPeerTransportTest, DeadlineCoversNameResolution) {
  Node named{"named", "dds-peer.invalid:4001", 0};

  auto started = std::chrono::steady_clock::now();
  auto manifest = transport->requestManifest(named, content.manifest.id, 1ms);
  ASSERT_LT(std::chrono::steady_clock::now() - started, 500ms);
  ASSERT_TRUE(manifest.has_error());
  ASSERT_TRUE(manifest.error() == TransportError::TIMEOUT
              or manifest.error() == TransportError::PEER_NOT_FOUND);

  EXPECT_OUTCOME_TRUE_1(
      transport->requestManifest(*server_peer, content.manifest.id, 5s));
}

/**
 * @given a client accepting only small frames
 * @when the peer answers with a larger one
 * @then the answer is rejected as malformed
 */
TEST_F(TcpPeerTransportTest, OversizedAnswer) {
  TcpPeerTransport small{Node{"client", "127.0.0.1:1", 0},
                         client_discovery,
                         TcpPeerTransport::Config{.max_message_size = 16}};
  EXPECT_EC(small.requestManifest(*server_peer, content.manifest.id, 5s),
            TransportError::MALFORMED_RESPONSE);
}

/**
 * @given a client which knows the server through discovery
 * @when it advertises content
 * @then the local node lists the content and the server learns the client
 * as a peer serving it
 */
TEST_F(TcpPeerTransportTest, AdvertiseReachesPeers) {
  auto published = testutil::makeContent("published by the client");
  EXPECT_OUTCOME_TRUE_1(transport->advertiseContent(published.manifest.id));

  ASSERT_TRUE(transport->localNode().advertises(published.manifest.id));

  EXPECT_OUTCOME_TRUE(peers, server_discovery->discoverPeers());
  ASSERT_EQ(peers.size(), 1);
  ASSERT_EQ(peers[0].id(), "client");
  ASSERT_EQ(peers[0].address(), "127.0.0.1:1");
  ASSERT_TRUE(peers[0].advertises(published.manifest.id));
}

/**
 * @given no known peers, or only unreachable ones
 * @when advertising
 * @then the former succeeds, the latter fails, and the local node records
 * the content either way
 */
TEST_F(TcpPeerTransportTest, AdvertiseWithoutReachablePeers) {
  auto published = testutil::makeContent("published while alone");

  TcpPeerTransport alone{
      Node{"alone", "127.0.0.1:1", 0},
      std::make_shared<BootstrapPeerDiscovery>(std::vector<std::string>{}),
      TcpPeerTransport::Config{}};
  EXPECT_OUTCOME_TRUE_1(alone.advertiseContent(published.manifest.id));
  ASSERT_TRUE(alone.localNode().advertises(published.manifest.id));

  TcpPeerTransport isolated{
      Node{"isolated", "127.0.0.1:1", 0},
      std::make_shared<BootstrapPeerDiscovery>(
          std::vector<std::string>{"not an address"}),
      TcpPeerTransport::Config{.advertise_timeout = 500ms}};
  EXPECT_EC(isolated.advertiseContent(published.manifest.id),
            TransportError::ADVERTISEMENT_FAILED);
  ASSERT_TRUE(isolated.localNode().advertises(published.manifest.id));
}

/**
 * @given a server
 * @when it is handed a response instead of a request
 * @then it refuses to answer
 */
TEST_F(TcpPeerTransportTest, ServerRejectsResponses) {
  EXPECT_EC(server->handle(AckResponse{}), MessageError::UNKNOWN_TYPE);
  EXPECT_OUTCOME_TRUE(answer,
                      server->handle(GetChunkRequest{content.chunks[0].id}));
  ASSERT_EQ(answer, Message{ChunkResponse{content.chunks[0]}});
}
