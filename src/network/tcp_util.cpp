/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/network/tcp_util.hpp>

#include <charconv>

#include <boost/asio/read.hpp>

#include <dds/codec/uvarint.hpp>
#include <dds/network/message.hpp>

namespace dds::network::detail {

  outcome::result<HostPort> splitAddress(std::string_view address) {
    auto colon = address.rfind(':');
    if (colon == std::string_view::npos or colon == 0) {
      return std::errc::invalid_argument;
    }
    auto host = address.substr(0, colon);
    auto port_str = address.substr(colon + 1);
    if (host.size() > 2 and host.front() == '[' and host.back() == ']') {
      host = host.substr(1, host.size() - 2);
    }

    uint16_t port = 0;
    auto [ptr, ec] = std::from_chars(
        port_str.data(), port_str.data() + port_str.size(), port);
    if (ec != std::errc{} or ptr != port_str.data() + port_str.size()
        or port_str.empty()) {
      return std::errc::invalid_argument;
    }
    return HostPort{std::string{host}, port};
  }

  std::string makeAddress(const Tcp::endpoint &endpoint) {
    auto ip = endpoint.address();
    if (ip.is_v6()) {
      return fmt::format("[{}]:{}", ip.to_string(), endpoint.port());
    }
    return fmt::format("{}:{}", ip.to_string(), endpoint.port());
  }

  namespace {
    /// State of one frame read, kept alive by the pending handlers
    struct FrameRead : std::enable_shared_from_this<FrameRead> {
      FrameRead(std::shared_ptr<Tcp::socket> socket,
                size_t max_size,
                FrameCallback cb)
          : socket{std::move(socket)}, max_size{max_size}, cb{std::move(cb)} {}

      void readLengthByte() {
        boost::asio::async_read(
            *socket,
            boost::asio::buffer(&byte, 1),
            [self{shared_from_this()}](const boost::system::error_code &ec,
                                       size_t) {
              if (ec) {
                return self->cb(ec);
              }
              self->length.push_back(self->byte);
              if ((self->byte & 0x80) != 0) {
                if (self->length.size() >= codec::kMaxVarintSize) {
                  return self->cb(MessageError::BAD_VARINT);
                }
                return self->readLengthByte();
              }
              self->onLength();
            });
      }

      void onLength() {
        auto decoded = codec::decodeVarint(length);
        if (decoded.has_error()) {
          return cb(MessageError::BAD_VARINT);
        }
        auto size = decoded.value().value;
        if (size > max_size) {
          return cb(MessageError::FRAME_TOO_LARGE);
        }
        if (size == 0) {
          return cb(Bytes{});
        }
        body.resize(size);
        boost::asio::async_read(
            *socket,
            boost::asio::buffer(body),
            [self{shared_from_this()}](const boost::system::error_code &ec,
                                       size_t) {
              if (ec) {
                return self->cb(ec);
              }
              self->cb(std::move(self->body));
            });
      }

      std::shared_ptr<Tcp::socket> socket;
      size_t max_size;
      FrameCallback cb;
      uint8_t byte = 0;
      Bytes length;
      Bytes body;
    };
  }  // namespace

  void asyncReadFrame(std::shared_ptr<Tcp::socket> socket,
                      size_t max_size,
                      FrameCallback cb) {
    std::make_shared<FrameRead>(std::move(socket), max_size, std::move(cb))
        ->readLengthByte();
  }

}  // namespace dds::network::detail
