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

#include <cstddef>
#include <cstdint>
#include <vector>

#include "pqharness/base/visibility.hpp"
#include "pqharness/framer/wire_message.hpp"

namespace pqharness {
namespace framer {

using Bytes = std::vector<uint8_t>;

/**
 * @brief Encoder/decoder for the startup, SSL negotiation and simple query messages.
 *
 * Stateless: no buffering and no I/O. Every decoder takes exactly one
 * complete frame and throws common::FramingError when the declared length
 * disagrees with the bytes supplied or the payload is malformed.
 *
 * Frame layouts (all integers big-endian):
 *   untagged:  u32 length | payload          (StartupPacket, SSLRequest)
 *   tagged:    u8 tag | u32 length | payload (everything after startup)
 *   SSL reply: one byte, 'S' or 'N'
 * length counts itself but never the tag.
 */
class PQHARNESS_API ProtocolFramer {
 public:
  static constexpr size_t kLengthSize = 4;
  static constexpr size_t kTagSize = 1;
  static constexpr size_t kTaggedHeaderSize = kTagSize + kLengthSize;

  static Bytes encode(const WireMessage& message);

  /**
   * @brief Decode a StartupPacket or SSLRequest frame
   */
  static WireMessage decode_startup(const uint8_t* data, size_t size);
  static WireMessage decode_startup(const Bytes& frame) { return decode_startup(frame.data(), frame.size()); }

  /**
   * @brief Decode one tagged frame (tag byte included)
   */
  static WireMessage decode_tagged(const uint8_t* data, size_t size);
  static WireMessage decode_tagged(const Bytes& frame) { return decode_tagged(frame.data(), frame.size()); }

  /**
   * @brief Decode the single-byte answer to an SSLRequest
   */
  static SslResponse decode_ssl_response(const uint8_t* data, size_t size);
  static SslResponse decode_ssl_response(const Bytes& frame) { return decode_ssl_response(frame.data(), frame.size()); }

  /**
   * @brief Read the length word at the start of data
   * @throws common::FramingError if fewer than 4 bytes are available or the value is below 4
   */
  static uint32_t read_length(const uint8_t* data, size_t size);
};

}  // namespace framer
}  // namespace pqharness
