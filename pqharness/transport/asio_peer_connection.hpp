/*
 * Copyright 2025 Jinwoo Sung
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include "pqharness/common/exceptions.hpp"
#include "pqharness/diagnostics/logger.hpp"
#include "pqharness/transport/peer_connection.hpp"
#include "pqharness/transport/timed_operation.hpp"

namespace pqharness {
namespace transport {

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

template <typename T>
struct is_ssl_stream : std::false_type {};

template <typename Next>
struct is_ssl_stream<ssl::stream<Next>> : std::true_type {};

/**
 * @brief PeerConnection over a Boost.Asio stream
 *
 * Stream is a plain tcp or local socket, or an ssl::stream wrapping one.
 * Each call starts one asynchronous operation and drives the shared
 * io_context until it completes or timeout() passes. The io_context is
 * only ever run by the thread that owns this connection.
 */
template <typename Stream>
class AsioPeerConnection : public PeerConnection {
 public:
  using PeerConnection::read_exact;

  template <typename... Args>
  explicit AsioPeerConnection(std::shared_ptr<net::io_context> ioc, Args&&... args)
      : ioc_(std::move(ioc)), stream_(std::forward<Args>(args)...) {}

  ~AsioPeerConnection() override { close(); }

  size_t read_some(uint8_t* data, size_t size) override {
    auto result = run([&](auto done) { stream_.async_read_some(net::buffer(data, size), done); }, "read");
    if (result.ec) {
      if (is_end_of_stream(result.ec)) {
        return 0;
      }
      throw common::ServerError("read failed: " + result.ec.message(), "read");
    }
    return result.transferred;
  }

  void read_exact(uint8_t* data, size_t size) override {
    auto result = run([&](auto done) { net::async_read(stream_, net::buffer(data, size), done); }, "read");
    if (result.ec) {
      if (is_end_of_stream(result.ec)) {
        throw common::FramingError("client closed the connection after " + std::to_string(result.transferred) +
                                       " of " + std::to_string(size) + " expected bytes",
                                   "read");
      }
      throw common::ServerError("read failed: " + result.ec.message(), "read");
    }
  }

  void write_all(const uint8_t* data, size_t size) override {
    auto result = run([&](auto done) { net::async_write(stream_, net::buffer(data, size), done); }, "write");
    if (result.ec) {
      throw common::ServerError("write failed: " + result.ec.message(), "write");
    }
  }

  void set_timeout(Duration timeout) override { timeout_ = timeout; }
  Duration timeout() const override { return timeout_; }

  void close() override {
    auto& socket = stream_.lowest_layer();
    if (!socket.is_open()) {
      return;
    }
    boost::system::error_code ec;
    socket.shutdown(net::socket_base::shutdown_both, ec);
    socket.close(ec);
    if (ec) {
      PQHARNESS_LOG_DEBUG("peer", "close", "close failed: " + ec.message());
    }
  }

  std::unique_ptr<PeerConnection> upgrade_to_tls(ssl::context& ctx) override {
    if constexpr (is_ssl_stream<Stream>::value) {
      throw common::ServerError("connection is already encrypted", "upgrade_to_tls", ErrorCode::InvalidState);
    } else {
      auto upgraded = std::make_unique<AsioPeerConnection<ssl::stream<Stream>>>(ioc_, std::move(stream_), ctx);
      upgraded->set_timeout(timeout_);
      upgraded->handshake();
      return upgraded;
    }
  }

  bool is_tls() const override { return is_ssl_stream<Stream>::value; }

  /**
   * @brief Server-side TLS handshake, bounded by timeout()
   */
  void handshake() {
    static_assert(is_ssl_stream<Stream>::value, "handshake requires an ssl::stream");
    auto result = run(
        [&](auto done) {
          stream_.async_handshake(ssl::stream_base::server,
                                  [done](const boost::system::error_code& ec) mutable { done(ec, 0); });
        },
        "handshake");
    if (result.ec) {
      throw common::ServerError("TLS handshake failed: " + result.ec.message(), "handshake");
    }
    PQHARNESS_LOG_DEBUG("peer", "handshake", "TLS established");
  }

  Stream& stream() { return stream_; }

 private:
  static bool is_end_of_stream(const boost::system::error_code& ec) {
    if (ec == net::error::eof) {
      return true;
    }
    if constexpr (is_ssl_stream<Stream>::value) {
      // Peer closed the TCP side without a TLS close_notify.
      return ec == ssl::error::stream_truncated;
    }
    return false;
  }

  template <typename Initiate>
  OperationResult run(Initiate&& initiate, const char* operation) {
    OperationResult result;
    initiate([&result](const boost::system::error_code& ec, size_t transferred) {
      result.ec = ec;
      result.transferred = transferred;
      result.completed = true;
    });

    bool finished = run_with_timeout(*ioc_, result, timeout_, [this] {
      boost::system::error_code ignored;
      stream_.lowest_layer().cancel(ignored);
    });
    if (!finished) {
      throw common::TimeoutError(std::string(operation) + " timed out", "peer", operation);
    }
    return result;
  }

  std::shared_ptr<net::io_context> ioc_;
  Stream stream_;
  Duration timeout_{std::chrono::seconds(1)};
};

using TcpPeerConnection = AsioPeerConnection<net::ip::tcp::socket>;
using UnixPeerConnection = AsioPeerConnection<net::local::stream_protocol::socket>;

}  // namespace transport
}  // namespace pqharness
