/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/network/tcp_peer_transport.hpp>

#include <future>

#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>
#include <boost/assert.hpp>

#include <dds/network/error.hpp>
#include <dds/network/tcp_util.hpp>

namespace dds::network {

  using detail::Tcp;

  namespace {
    /// One request and its answer, kept alive by the pending handlers
    class Exchange : public std::enable_shared_from_this<Exchange> {
     public:
      Exchange(boost::asio::io_context &context,
               Bytes frame,
               size_t max_size,
               log::Logger log)
          : resolver_{context},
            socket_{std::make_shared<Tcp::socket>(context)},
            frame_{std::move(frame)},
            max_size_{max_size},
            log_{std::move(log)} {}

      std::future<outcome::result<Message>> answer() {
        return promise_.get_future();
      }

      /// Must run on the io_context thread, as every other member
      void start(const detail::HostPort &address) {
        boost::system::error_code ec;
        auto ip = boost::asio::ip::make_address(address.host, ec);
        if (not ec) {
          socket_->async_connect(
              Tcp::endpoint{ip, address.port},
              [self{shared_from_this()}](const boost::system::error_code &ec) {
                self->onConnect(ec);
              });
          return;
        }
        resolver_.async_resolve(
            address.host,
            std::to_string(address.port),
            [self{shared_from_this()}, host{address.host}](
                const boost::system::error_code &ec,
                const Tcp::resolver::results_type &endpoints) {
              if (ec) {
                self->log_->debug("cannot resolve {}: {}", host, ec.message());
                return self->finish(TransportError::PEER_NOT_FOUND);
              }
              boost::asio::async_connect(
                  *self->socket_,
                  endpoints,
                  [self](const boost::system::error_code &ec,
                         const Tcp::endpoint &) { self->onConnect(ec); });
            });
      }

      void cancel() {
        resolver_.cancel();
        boost::system::error_code ignored;
        socket_->close(ignored);
      }

     private:
      void onConnect(const boost::system::error_code &ec) {
        if (ec) {
          return finish(TransportError::PEER_NOT_FOUND);
        }
        boost::asio::async_write(
            *socket_,
            boost::asio::buffer(frame_),
            [self{shared_from_this()}](const boost::system::error_code &ec,
                                       size_t) {
              if (ec) {
                return self->finish(TransportError::CONNECTION_FAILED);
              }
              detail::asyncReadFrame(
                  self->socket_,
                  self->max_size_,
                  [self](outcome::result<Bytes> body) { self->onFrame(body); });
            });
      }

      void onFrame(const outcome::result<Bytes> &body) {
        if (body.has_error()) {
          return finish(body.error() == MessageError::FRAME_TOO_LARGE
                            ? TransportError::MALFORMED_RESPONSE
                            : TransportError::CONNECTION_FAILED);
        }
        auto message = decodeMessage(body.value());
        if (message.has_error()) {
          return finish(TransportError::MALFORMED_RESPONSE);
        }
        finish(std::move(message.value()));
      }

      void finish(outcome::result<Message> result) {
        if (done_) {
          return;
        }
        done_ = true;
        boost::system::error_code ignored;
        socket_->close(ignored);
        promise_.set_value(std::move(result));
      }

      Tcp::resolver resolver_;
      std::shared_ptr<Tcp::socket> socket_;
      Bytes frame_;
      size_t max_size_;
      log::Logger log_;
      std::promise<outcome::result<Message>> promise_;
      bool done_ = false;
    };
  }  // namespace

  TcpPeerTransport::TcpPeerTransport(Node local_node,
                                     std::shared_ptr<PeerDiscovery> discovery,
                                     Config config)
      : local_node_{std::move(local_node)},
        discovery_{std::move(discovery)},
        config_{config},
        log_{log::createLogger("TcpPeerTransport")},
        work_{boost::asio::make_work_guard(context_)},
        thread_{[this] { context_.run(); }} {
    BOOST_ASSERT(discovery_ != nullptr);
  }

  TcpPeerTransport::~TcpPeerTransport() {
    work_.reset();
    context_.stop();
    thread_.join();
  }

  outcome::result<Manifest> TcpPeerTransport::requestManifest(
      const Node &peer, const ContentHash &manifest_id, Timeout timeout) {
    OUTCOME_TRY(answer,
                exchange(peer, GetManifestRequest{manifest_id}, timeout));
    if (std::holds_alternative<NotFoundResponse>(answer)) {
      return TransportError::MANIFEST_UNAVAILABLE;
    }
    auto response = std::get_if<ManifestResponse>(&answer);
    if (response == nullptr or response->manifest.id != manifest_id) {
      log_->warn("{} answered GET_MANIFEST {} with a mismatching message",
                 peer.address(),
                 manifest_id);
      return TransportError::MALFORMED_RESPONSE;
    }
    return std::move(response->manifest);
  }

  outcome::result<Chunk> TcpPeerTransport::requestChunk(
      const Node &peer, const ContentHash &chunk_id, Timeout timeout) {
    OUTCOME_TRY(answer, exchange(peer, GetChunkRequest{chunk_id}, timeout));
    if (std::holds_alternative<NotFoundResponse>(answer)) {
      return TransportError::CHUNK_UNAVAILABLE;
    }
    auto response = std::get_if<ChunkResponse>(&answer);
    if (response == nullptr or response->chunk.id != chunk_id) {
      log_->warn("{} answered GET_CHUNK {} with a mismatching message",
                 peer.address(),
                 chunk_id);
      return TransportError::MALFORMED_RESPONSE;
    }
    return std::move(response->chunk);
  }

  outcome::result<void> TcpPeerTransport::advertiseContent(
      const ContentHash &manifest_id) {
    AdvertiseNotice notice{manifest_id, {}, {}};
    {
      std::lock_guard lock(mutex_);
      local_node_.addAdvertisedContent(manifest_id);
      notice.node_id = local_node_.id();
      notice.address = local_node_.address();
    }

    OUTCOME_TRY(peers, discovery_->discoverPeers());
    size_t targets = 0;
    size_t accepted = 0;
    for (const auto &peer : peers) {
      if (peer.address() == notice.address) {
        continue;
      }
      ++targets;
      auto answer = exchange(peer, notice, config_.advertise_timeout);
      if (answer.has_error()) {
        log_->warn("advertisement of {} to {} failed: {}",
                   manifest_id,
                   peer.address(),
                   answer.error());
        continue;
      }
      if (not std::holds_alternative<AckResponse>(answer.value())) {
        log_->warn("{} did not acknowledge advertisement of {}",
                   peer.address(),
                   manifest_id);
        continue;
      }
      ++accepted;
    }

    if (targets != 0 and accepted == 0) {
      return TransportError::ADVERTISEMENT_FAILED;
    }
    log_->debug("advertised {} to {} of {} peers", manifest_id, accepted,
                targets);
    return outcome::success();
  }

  Node TcpPeerTransport::localNode() const {
    std::lock_guard lock(mutex_);
    return local_node_;
  }

  outcome::result<Message> TcpPeerTransport::exchange(const Node &peer,
                                                      const Message &request,
                                                      Timeout timeout) {
    auto address = detail::splitAddress(peer.address());
    if (address.has_error()) {
      log_->debug("cannot parse peer address '{}'", peer.address());
      return TransportError::PEER_NOT_FOUND;
    }

    OUTCOME_TRY(encoded, encodeMessage(request));
    auto round_trip = std::make_shared<Exchange>(
        context_, makeFrame(encoded), config_.max_message_size, log_);
    auto answer = round_trip->answer();
    boost::asio::post(context_,
                      [round_trip, host_port{std::move(address.value())}] {
                        round_trip->start(host_port);
                      });

    if (answer.wait_for(timeout) != std::future_status::ready) {
      log_->debug("{} did not answer within {} ms", peer.address(),
                  timeout.count());
      boost::asio::post(context_, [round_trip] { round_trip->cancel(); });
      return TransportError::TIMEOUT;
    }
    return answer.get();
  }

}  // namespace dds::network
