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

#include "pqharness/transport/peer_connection.hpp"

#include <string>
#include <utility>
#include <variant>

#include "pqharness/common/exceptions.hpp"
#include "pqharness/diagnostics/logger.hpp"

namespace pqharness {
namespace transport {

using common::FramingError;
using common::PeerAssertionError;

namespace {

template <typename T>
T expect_type(framer::WireMessage message, const char* expected) {
  if (auto* typed = std::get_if<T>(&message)) {
    return std::move(*typed);
  }
  throw PeerAssertionError(std::string("expected ") + expected + ", got " + framer::message_name(message));
}

void check_length(uint32_t declared, size_t max_length) {
  if (declared > max_length) {
    throw FramingError("declared length " + std::to_string(declared) + " exceeds the limit of " +
                           std::to_string(max_length) + " bytes",
                       "receive");
  }
}

}  // namespace

Bytes PeerConnection::read_exact(size_t size) {
  Bytes data(size);
  if (size > 0) {
    read_exact(data.data(), size);
  }
  return data;
}

void PeerConnection::expect_eof() {
  uint8_t byte = 0;
  if (read_some(&byte, 1) != 0) {
    throw PeerAssertionError("client sent unexpected data", "expect_eof");
  }
}

void PeerConnection::send(const framer::WireMessage& message) {
  Bytes bytes = framer::ProtocolFramer::encode(message);
  PQHARNESS_LOG_DEBUG("peer", "send", framer::message_name(message) + " (" + std::to_string(bytes.size()) + " bytes)");
  write_all(bytes.data(), bytes.size());
}

void PeerConnection::send_raw(const Bytes& bytes) {
  if (!bytes.empty()) {
    write_all(bytes.data(), bytes.size());
  }
}

framer::WireMessage PeerConnection::receive_startup(size_t max_length) {
  Bytes frame = read_exact(framer::ProtocolFramer::kLengthSize);
  uint32_t declared = framer::ProtocolFramer::read_length(frame.data(), frame.size());
  check_length(declared, max_length);

  frame.resize(declared);
  read_exact(frame.data() + framer::ProtocolFramer::kLengthSize, declared - framer::ProtocolFramer::kLengthSize);

  auto message = framer::ProtocolFramer::decode_startup(frame);
  PQHARNESS_LOG_DEBUG("peer", "receive", framer::message_name(message));
  return message;
}

framer::WireMessage PeerConnection::receive_message(size_t max_length) {
  Bytes frame = read_exact(framer::ProtocolFramer::kTaggedHeaderSize);
  uint32_t declared = framer::ProtocolFramer::read_length(frame.data() + framer::ProtocolFramer::kTagSize,
                                                         framer::ProtocolFramer::kLengthSize);
  check_length(declared, max_length);

  frame.resize(framer::ProtocolFramer::kTagSize + declared);
  read_exact(frame.data() + framer::ProtocolFramer::kTaggedHeaderSize,
             declared - framer::ProtocolFramer::kLengthSize);

  auto message = framer::ProtocolFramer::decode_tagged(frame);
  PQHARNESS_LOG_DEBUG("peer", "receive", framer::message_name(message));
  return message;
}

framer::StartupPacket PeerConnection::expect_startup(uint16_t major, uint16_t minor) {
  auto packet = expect_type<framer::StartupPacket>(receive_startup(), "StartupPacket");
  if (packet.major != major || packet.minor != minor) {
    throw PeerAssertionError("expected protocol version " + std::to_string(major) + "." + std::to_string(minor) +
                             ", got " + std::to_string(packet.major) + "." + std::to_string(packet.minor));
  }
  return packet;
}

void PeerConnection::expect_ssl_request() { expect_type<framer::SslRequest>(receive_startup(), "SSLRequest"); }

framer::SimpleQuery PeerConnection::expect_query() {
  return expect_type<framer::SimpleQuery>(receive_message(), "Query");
}

void PeerConnection::expect_terminate() { expect_type<framer::Terminate>(receive_message(), "Terminate"); }

}  // namespace transport
}  // namespace pqharness
