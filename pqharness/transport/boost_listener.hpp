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

#include <sys/stat.h>

#include <boost/asio.hpp>
#include <memory>
#include <type_traits>
#include <utility>

#include "pqharness/common/exceptions.hpp"
#include "pqharness/transport/asio_peer_connection.hpp"
#include "pqharness/transport/listener.hpp"
#include "pqharness/transport/timed_operation.hpp"

namespace pqharness {
namespace transport {

namespace net = boost::asio;

/**
 * @brief Listener on a Boost.Asio acceptor
 *
 * Protocol is net::ip::tcp or net::local::stream_protocol. A UNIX socket
 * file is created under umask 077 so only the owner can connect.
 */
template <typename Protocol>
class BoostListener : public Listener {
 public:
  using Endpoint = typename Protocol::endpoint;
  using Socket = typename Protocol::socket;

  BoostListener(std::shared_ptr<net::io_context> ioc, Endpoint endpoint)
      : ioc_(std::move(ioc)), acceptor_(*ioc_), endpoint_(std::move(endpoint)) {}
  ~BoostListener() override = default;

  void open_and_bind(boost::system::error_code& ec) override {
    acceptor_.open(endpoint_.protocol(), ec);
    if (ec) {
      return;
    }
    if constexpr (std::is_same<Protocol, net::ip::tcp>::value) {
      acceptor_.set_option(net::socket_base::reuse_address(true), ec);
      if (ec) {
        return;
      }
      acceptor_.bind(endpoint_, ec);
    } else {
      mode_t previous = ::umask(077);
      acceptor_.bind(endpoint_, ec);
      ::umask(previous);
    }
  }

  void listen(int backlog, boost::system::error_code& ec) override { acceptor_.listen(backlog, ec); }

  std::unique_ptr<PeerConnection> accept(Duration timeout) override {
    Socket socket(*ioc_);
    OperationResult result;
    acceptor_.async_accept(socket, [&result](const boost::system::error_code& ec) {
      result.ec = ec;
      result.completed = true;
    });

    bool finished = run_with_timeout(*ioc_, result, timeout, [this] {
      boost::system::error_code ignored;
      acceptor_.cancel(ignored);
    });
    if (!finished) {
      throw common::TimeoutError("no client connected before the deadline", "background_server", "accept");
    }
    if (result.ec) {
      throw common::ServerError("accept failed: " + result.ec.message(), "accept", ErrorCode::AcceptFailed);
    }
    return std::make_unique<AsioPeerConnection<Socket>>(ioc_, std::move(socket));
  }

  bool is_open() const override { return acceptor_.is_open(); }

  void close(boost::system::error_code& ec) override { acceptor_.close(ec); }

  uint16_t local_port() const override {
    if constexpr (std::is_same<Protocol, net::ip::tcp>::value) {
      boost::system::error_code ec;
      auto bound = acceptor_.local_endpoint(ec);
      return ec ? endpoint_.port() : bound.port();
    } else {
      return port_;
    }
  }

  void set_reported_port(uint16_t port) { port_ = port; }

 private:
  std::shared_ptr<net::io_context> ioc_;
  typename Protocol::acceptor acceptor_;
  Endpoint endpoint_;
  uint16_t port_ = 0;
};

}  // namespace transport
}  // namespace pqharness
