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

#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>

#include "pqharness/base/visibility.hpp"
#include "pqharness/framer/protocol_framer.hpp"
#include "pqharness/framer/wire_message.hpp"

namespace pqharness {
namespace transport {

using framer::Bytes;

/**
 * @brief Server side of one accepted client connection
 *
 * Every blocking call is bounded by timeout(); expiry raises
 * common::TimeoutError. The connection is owned by the background worker
 * and must not be shared with the test thread.
 */
class PQHARNESS_API PeerConnection {
 public:
  using Duration = std::chrono::steady_clock::duration;

  static constexpr size_t kDefaultMaxMessageLength = 1 << 20;

  virtual ~PeerConnection() = default;

  /**
   * @brief Read up to size bytes
   * @return number of bytes read, 0 once the client has closed its side
   */
  virtual size_t read_some(uint8_t* data, size_t size) = 0;

  /**
   * @brief Read exactly size bytes
   * @throws common::FramingError if the client closes first
   */
  virtual void read_exact(uint8_t* data, size_t size) = 0;

  virtual void write_all(const uint8_t* data, size_t size) = 0;

  virtual void set_timeout(Duration timeout) = 0;
  virtual Duration timeout() const = 0;

  /**
   * @brief Close the socket. Safe to call more than once.
   */
  virtual void close() = 0;

  /**
   * @brief Run a server-side TLS handshake over this connection
   *
   * The returned connection takes over the socket; this object is left
   * closed. Throws common::ServerError on a connection that is already
   * encrypted.
   */
  virtual std::unique_ptr<PeerConnection> upgrade_to_tls(boost::asio::ssl::context& ctx) = 0;

  virtual bool is_tls() const = 0;

  Bytes read_exact(size_t size);

  /**
   * @brief Require that the client closes without sending anything else
   * @throws common::PeerAssertionError if a byte arrives
   */
  void expect_eof();

  void send(const framer::WireMessage& message);
  void send_raw(const Bytes& bytes);

  /**
   * @brief Read one untagged frame: StartupPacket or SSLRequest
   */
  framer::WireMessage receive_startup(size_t max_length = kDefaultMaxMessageLength);

  /**
   * @brief Read one tagged frame
   */
  framer::WireMessage receive_message(size_t max_length = kDefaultMaxMessageLength);

  /**
   * @brief receive_startup() and require a StartupPacket of the given version
   */
  framer::StartupPacket expect_startup(uint16_t major = framer::kProtocolMajor,
                                       uint16_t minor = framer::kProtocolMinor);

  void expect_ssl_request();

  framer::SimpleQuery expect_query();

  void expect_terminate();
};

}  // namespace transport
}  // namespace pqharness
