/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/network/peer_server.hpp>

#include <boost/asio/write.hpp>

#include <dds/network/bootstrap_peer_discovery.hpp>
#include <dds/network/tcp_util.hpp>

namespace dds::network {

  PeerServer::PeerServer(std::shared_ptr<storage::Storage> storage,
                         AdvertiseHandler on_advertise,
                         size_t max_message_size)
      : storage_{std::move(storage)},
        on_advertise_{std::move(on_advertise)},
        max_message_size_{max_message_size},
        acceptor_{context_},
        log_{log::createLogger("PeerServer")} {}

  PeerServer::~PeerServer() {
    stop();
  }

  outcome::result<void> PeerServer::listen(std::string_view address) {
    if (acceptor_.is_open()) {
      return std::errc::already_connected;
    }
    OUTCOME_TRY(host_port, detail::splitAddress(address));

    boost::system::error_code ec;
    auto ip = boost::asio::ip::make_address(host_port.host, ec);
    if (ec) {
      return ec;
    }
    Tcp::endpoint endpoint{ip, host_port.port};

    try {
      // setup acceptor, throws
      acceptor_.open(endpoint.protocol());
      acceptor_.set_option(Tcp::acceptor::reuse_address(true));
      acceptor_.bind(endpoint);
      acceptor_.listen();
    } catch (const boost::system::system_error &e) {
      log_->error("Cannot listen to {}: {}", address, e.code().message());
      boost::system::error_code ignored;
      acceptor_.close(ignored);
      return e.code();
    }

    doAccept();
    thread_ = std::thread([this] { context_.run(); });
    OUTCOME_TRY(bound, listenAddress());
    log_->info("serving on {}", bound);
    return outcome::success();
  }

  outcome::result<std::string> PeerServer::listenAddress() const {
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    if (ec) {
      return ec;
    }
    return detail::makeAddress(endpoint);
  }

  void PeerServer::stop() {
    if (not thread_.joinable()) {
      return;
    }
    context_.stop();
    thread_.join();
    boost::system::error_code ignored;
    acceptor_.close(ignored);
  }

  outcome::result<Message> PeerServer::handle(const Message &request) {
    if (auto get = std::get_if<GetManifestRequest>(&request)) {
      auto manifest = storage_->getManifest(get->id);
      if (manifest.has_error()) {
        if (not storage::isNotFound(manifest.error())) {
          log_->warn("cannot read manifest {}: {}", get->id, manifest.error());
        }
        return NotFoundResponse{get->id};
      }
      return ManifestResponse{std::move(manifest.value())};
    }

    if (auto get = std::get_if<GetChunkRequest>(&request)) {
      auto chunk = storage_->getChunk(get->id);
      if (chunk.has_error()) {
        if (not storage::isNotFound(chunk.error())) {
          log_->warn("cannot read chunk {}: {}", get->id, chunk.error());
        }
        return NotFoundResponse{get->id};
      }
      return ChunkResponse{std::move(chunk.value())};
    }

    if (auto notice = std::get_if<AdvertiseNotice>(&request)) {
      if (notice->address.empty() or notice->node_id.empty()) {
        log_->warn("ignoring advertisement of {} without sender",
                   notice->manifest_id);
      } else if (on_advertise_) {
        on_advertise_(Node{notice->node_id,
                           notice->address,
                           BootstrapPeerDiscovery::kDefaultReputation},
                      notice->manifest_id);
      }
      return AckResponse{};
    }

    return MessageError::UNKNOWN_TYPE;
  }

  void PeerServer::doAccept() {
    if (not acceptor_.is_open()) {
      return;
    }
    acceptor_.async_accept(
        [this](const boost::system::error_code &ec, Tcp::socket socket) {
          if (ec) {
            if (ec != boost::asio::error::operation_aborted) {
              log_->warn("accept failed: {}", ec.message());
              doAccept();
            }
            return;
          }
          readRequest(std::make_shared<Tcp::socket>(std::move(socket)));
          doAccept();
        });
  }

  void PeerServer::readRequest(std::shared_ptr<Tcp::socket> socket) {
    detail::asyncReadFrame(
        socket, max_message_size_, [this, socket](outcome::result<Bytes> body) {
          if (body.has_error()) {
            log_->debug("connection closed: {}", body.error());
            return;
          }
          auto request = decodeMessage(body.value());
          if (request.has_error()) {
            log_->warn("malformed request: {}", request.error());
            return;
          }
          auto response = handle(request.value());
          if (response.has_error()) {
            log_->warn("unexpected message of type {}",
                       static_cast<int>(messageType(request.value())));
            return;
          }
          auto encoded = encodeMessage(response.value());
          if (encoded.has_error()) {
            log_->error("cannot encode response: {}", encoded.error());
            return;
          }
          auto frame = std::make_shared<Bytes>(makeFrame(encoded.value()));
          boost::asio::async_write(
              *socket,
              boost::asio::buffer(*frame),
              [this, socket, frame](const boost::system::error_code &ec,
                                    size_t) {
                if (ec) {
                  log_->debug("cannot answer: {}", ec.message());
                  return;
                }
                readRequest(socket);
              });
        });
  }

}  // namespace dds::network
