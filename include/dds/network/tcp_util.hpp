/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include <boost/asio/ip/tcp.hpp>

#include <dds/common/types.hpp>
#include <dds/outcome/outcome.hpp>

namespace dds::network::detail {

  using Tcp = boost::asio::ip::tcp;

  struct HostPort {
    std::string host;
    uint16_t port = 0;
  };

  /**
   * Split "host:port". IPv6 hosts are written in brackets: "[::1]:4001"
   */
  outcome::result<HostPort> splitAddress(std::string_view address);

  /// Render an endpoint back to "host:port"
  std::string makeAddress(const Tcp::endpoint &endpoint);

  using FrameCallback = std::function<void(outcome::result<Bytes>)>;

  /**
   * Read one length-prefixed frame from the socket
   * @param max_size - longer frames fail with MessageError::FRAME_TOO_LARGE
   * @param cb - receives the frame body or the read error
   */
  void asyncReadFrame(std::shared_ptr<Tcp::socket> socket,
                      size_t max_size,
                      FrameCallback cb);

}  // namespace dds::network::detail
