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

#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstdint>
#include <memory>

#include "pqharness/base/visibility.hpp"
#include "pqharness/config/server_config.hpp"
#include "pqharness/transport/peer_connection.hpp"

namespace pqharness {
namespace transport {

/**
 * @brief Listening socket that hands out one PeerConnection per accept
 */
class PQHARNESS_API Listener {
 public:
  using Duration = std::chrono::steady_clock::duration;

  virtual ~Listener() = default;

  virtual void open_and_bind(boost::system::error_code& ec) = 0;
  virtual void listen(int backlog, boost::system::error_code& ec) = 0;

  /**
   * @brief Wait for one client
   * @throws common::TimeoutError if nobody connects within timeout
   * @throws common::ServerError if the accept itself fails
   */
  virtual std::unique_ptr<PeerConnection> accept(Duration timeout) = 0;

  virtual bool is_open() const = 0;
  virtual void close(boost::system::error_code& ec) = 0;

  /**
   * @brief Bound port; the configured port for UNIX sockets
   */
  virtual uint16_t local_port() const = 0;
};

/**
 * @brief Build the listener for a UNIX or TCP endpoint
 *
 * The listener and every connection it accepts share ioc.
 */
PQHARNESS_API std::unique_ptr<Listener> make_listener(const config::ServerConfig& cfg,
                                                      std::shared_ptr<boost::asio::io_context> ioc);

}  // namespace transport
}  // namespace pqharness
