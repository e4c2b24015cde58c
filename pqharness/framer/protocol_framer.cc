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

#include "pqharness/framer/protocol_framer.hpp"

#include <algorithm>
#include <boost/endian/conversion.hpp>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>

#include "pqharness/common/exceptions.hpp"

namespace pqharness {
namespace framer {

using common::FramingError;

namespace {

constexpr uint32_t kAuthenticationOkStatus = 0;
constexpr size_t kStartupHeaderSize = 8;

void put_u16(Bytes& out, uint16_t value) {
  uint8_t buf[2];
  boost::endian::store_big_u16(buf, value);
  out.insert(out.end(), buf, buf + 2);
}

void put_u32(Bytes& out, uint32_t value) {
  uint8_t buf[4];
  boost::endian::store_big_u32(buf, value);
  out.insert(out.end(), buf, buf + 4);
}

void put_cstring(Bytes& out, const std::string& value, const char* field) {
  if (value.find('\0') != std::string::npos) {
    throw FramingError(std::string(field) + " contains an embedded NUL", "encode");
  }
  out.insert(out.end(), value.begin(), value.end());
  out.push_back('\0');
}

// Patch the length word at `at` so that it covers everything after it plus itself.
void patch_length(Bytes& out, size_t at) {
  size_t length = out.size() - at;
  if (length > std::numeric_limits<uint32_t>::max()) {
    throw FramingError("message too large: " + std::to_string(length) + " bytes", "encode");
  }
  boost::endian::store_big_u32(out.data() + at, static_cast<uint32_t>(length));
}

Bytes tagged(uint8_t type, const Bytes& payload) {
  Bytes out;
  out.reserve(ProtocolFramer::kTaggedHeaderSize + payload.size());
  out.push_back(type);
  put_u32(out, 0);
  out.insert(out.end(), payload.begin(), payload.end());
  patch_length(out, ProtocolFramer::kTagSize);
  return out;
}

/**
 * Cursor over a payload whose bounds were already checked against the
 * declared length. Every read must stay inside the payload.
 */
class PayloadReader {
 public:
  PayloadReader(const uint8_t* data, size_t size, size_t base_offset, const char* message)
      : data_(data), size_(size), base_(base_offset), message_(message) {}

  uint32_t u32() {
    require(4, "u32");
    uint32_t value = boost::endian::load_big_u32(data_ + pos_);
    pos_ += 4;
    return value;
  }

  uint16_t u16() {
    require(2, "u16");
    uint16_t value = boost::endian::load_big_u16(data_ + pos_);
    pos_ += 2;
    return value;
  }

  uint8_t u8() {
    require(1, "u8");
    return data_[pos_++];
  }

  std::string cstring() {
    const uint8_t* begin = data_ + pos_;
    const uint8_t* end = data_ + size_;
    const uint8_t* nul = std::find(begin, end, '\0');
    if (nul == end) {
      throw FramingError(std::string(message_) + ": string is not NUL-terminated within the declared length",
                         "decode", base_ + pos_);
    }
    std::string value(reinterpret_cast<const char*>(begin), static_cast<size_t>(nul - begin));
    pos_ += value.size() + 1;
    return value;
  }

  bool at_end() const { return pos_ == size_; }
  size_t remaining() const { return size_ - pos_; }

  void expect_end() const {
    if (!at_end()) {
      throw FramingError(std::string(message_) + ": " + std::to_string(remaining()) +
                             " unexpected trailing bytes",
                         "decode", base_ + pos_);
    }
  }

 private:
  void require(size_t n, const char* what) const {
    if (size_ - pos_ < n) {
      throw FramingError(std::string(message_) + ": payload too short for " + what, "decode", base_ + pos_);
    }
  }

  const uint8_t* data_;
  size_t size_;
  size_t base_;
  const char* message_;
  size_t pos_ = 0;
};

struct Encoder {
  Bytes operator()(const StartupPacket& m) const {
    Bytes out;
    put_u32(out, 0);
    put_u16(out, m.major);
    put_u16(out, m.minor);
    for (const auto& param : m.parameters) {
      put_cstring(out, param.first, "startup parameter name");
      put_cstring(out, param.second, "startup parameter value");
    }
    out.push_back('\0');
    patch_length(out, 0);
    return out;
  }

  Bytes operator()(const SslRequest&) const {
    Bytes out;
    put_u32(out, kStartupHeaderSize);
    put_u16(out, kSslRequestMajor);
    put_u16(out, kSslRequestMinor);
    return out;
  }

  Bytes operator()(const SslResponse& m) const { return Bytes{m.accept ? kSslAccept : kSslReject}; }

  Bytes operator()(const AuthenticationOk&) const {
    Bytes payload;
    put_u32(payload, kAuthenticationOkStatus);
    return tagged(tag::kAuthentication, payload);
  }

  Bytes operator()(const ParameterStatus& m) const {
    Bytes payload;
    put_cstring(payload, m.key, "parameter name");
    put_cstring(payload, m.value, "parameter value");
    return tagged(tag::kParameterStatus, payload);
  }

  Bytes operator()(const BackendKeyData& m) const {
    Bytes payload;
    put_u32(payload, m.pid);
    put_u32(payload, m.secret);
    return tagged(tag::kBackendKeyData, payload);
  }

  Bytes operator()(const ReadyForQuery& m) const { return tagged(tag::kReadyForQuery, Bytes{m.status}); }

  Bytes operator()(const SimpleQuery& m) const {
    Bytes payload;
    put_cstring(payload, m.text, "query text");
    return tagged(tag::kQuery, payload);
  }

  Bytes operator()(const EmptyQueryResponse&) const { return tagged(tag::kEmptyQueryResponse, Bytes{}); }

  Bytes operator()(const Terminate&) const { return tagged(tag::kTerminate, Bytes{}); }

  Bytes operator()(const LegacyErrorResponse& m) const {
    Bytes out{tag::kErrorResponse};
    put_cstring(out, m.message, "error message");
    return out;
  }
};

struct Namer {
  std::string operator()(const StartupPacket&) const { return "StartupPacket"; }
  std::string operator()(const SslRequest&) const { return "SSLRequest"; }
  std::string operator()(const SslResponse&) const { return "SSLResponse"; }
  std::string operator()(const AuthenticationOk&) const { return "AuthenticationOK"; }
  std::string operator()(const ParameterStatus&) const { return "ParameterStatus"; }
  std::string operator()(const BackendKeyData&) const { return "BackendKeyData"; }
  std::string operator()(const ReadyForQuery&) const { return "ReadyForQuery"; }
  std::string operator()(const SimpleQuery&) const { return "Query"; }
  std::string operator()(const EmptyQueryResponse&) const { return "EmptyQueryResponse"; }
  std::string operator()(const Terminate&) const { return "Terminate"; }
  std::string operator()(const LegacyErrorResponse&) const { return "ErrorResponse(v2)"; }
};

std::string printable_tag(uint8_t type) {
  if (type >= 0x20 && type < 0x7f) {
    return std::string("'") + static_cast<char>(type) + "'";
  }
  std::ostringstream oss;
  oss << "0x" << std::hex << std::setfill('0') << std::setw(2) << static_cast<unsigned>(type);
  return oss.str();
}

}  // namespace

std::string message_name(const WireMessage& message) { return std::visit(Namer{}, message); }

Bytes ProtocolFramer::encode(const WireMessage& message) { return std::visit(Encoder{}, message); }

uint32_t ProtocolFramer::read_length(const uint8_t* data, size_t size) {
  if (size < kLengthSize) {
    throw FramingError("need 4 bytes for a length word, have " + std::to_string(size), "read_length");
  }
  uint32_t length = boost::endian::load_big_u32(data);
  if (length < kLengthSize) {
    throw FramingError("declared length " + std::to_string(length) + " is smaller than the length word itself",
                       "read_length");
  }
  return length;
}

WireMessage ProtocolFramer::decode_startup(const uint8_t* data, size_t size) {
  uint32_t declared = read_length(data, size);
  if (declared != size) {
    throw FramingError("startup frame declares " + std::to_string(declared) + " bytes but " + std::to_string(size) +
                       " are available");
  }
  if (declared < kStartupHeaderSize) {
    throw FramingError("startup frame of " + std::to_string(declared) + " bytes has no protocol version");
  }

  PayloadReader reader(data + kLengthSize, size - kLengthSize, kLengthSize, "startup packet");
  uint16_t major = reader.u16();
  uint16_t minor = reader.u16();

  if (major == kSslRequestMajor) {
    if (minor != kSslRequestMinor) {
      throw FramingError("unsupported request code " + std::to_string(major) + "/" + std::to_string(minor));
    }
    reader.expect_end();
    return SslRequest{};
  }

  StartupPacket packet;
  packet.major = major;
  packet.minor = minor;

  // Parameters are name/value pairs closed by an empty name.
  while (!reader.at_end()) {
    std::string name = reader.cstring();
    if (name.empty()) {
      reader.expect_end();
      break;
    }
    if (reader.at_end()) {
      throw FramingError("startup parameter '" + name + "' has no value");
    }
    std::string value = reader.cstring();
    packet.parameters.emplace_back(std::move(name), std::move(value));
    if (reader.at_end()) {
      throw FramingError("startup parameter list is not terminated");
    }
  }
  return packet;
}

WireMessage ProtocolFramer::decode_tagged(const uint8_t* data, size_t size) {
  if (size < kTaggedHeaderSize) {
    throw FramingError("tagged frame needs at least 5 bytes, have " + std::to_string(size));
  }
  uint8_t type = data[0];
  uint32_t declared = read_length(data + kTagSize, size - kTagSize);
  if (static_cast<size_t>(declared) + kTagSize != size) {
    throw FramingError("message " + printable_tag(type) + " declares length " + std::to_string(declared) + " but " +
                       std::to_string(size - kTagSize) + " bytes are available");
  }

  PayloadReader reader(data + kTaggedHeaderSize, size - kTaggedHeaderSize, kTaggedHeaderSize,
                       "tagged message");

  switch (type) {
    case tag::kAuthentication: {
      uint32_t status = reader.u32();
      reader.expect_end();
      if (status != kAuthenticationOkStatus) {
        throw FramingError("unsupported authentication request " + std::to_string(status));
      }
      return AuthenticationOk{};
    }
    case tag::kParameterStatus: {
      ParameterStatus m;
      m.key = reader.cstring();
      m.value = reader.cstring();
      reader.expect_end();
      return m;
    }
    case tag::kBackendKeyData: {
      BackendKeyData m;
      m.pid = reader.u32();
      m.secret = reader.u32();
      reader.expect_end();
      return m;
    }
    case tag::kReadyForQuery: {
      ReadyForQuery m;
      m.status = reader.u8();
      reader.expect_end();
      if (m.status != kTransactionIdle && m.status != kTransactionInBlock && m.status != kTransactionFailed) {
        throw FramingError("invalid transaction status " + printable_tag(m.status));
      }
      return m;
    }
    case tag::kQuery: {
      SimpleQuery m;
      m.text = reader.cstring();
      reader.expect_end();
      return m;
    }
    case tag::kEmptyQueryResponse:
      reader.expect_end();
      return EmptyQueryResponse{};
    case tag::kTerminate:
      reader.expect_end();
      return Terminate{};
    default:
      throw FramingError("unexpected message type " + printable_tag(type));
  }
}

SslResponse ProtocolFramer::decode_ssl_response(const uint8_t* data, size_t size) {
  if (size != 1) {
    throw FramingError("SSL response must be exactly one byte, have " + std::to_string(size));
  }
  if (data[0] == kSslAccept) {
    return SslResponse{true};
  }
  if (data[0] == kSslReject) {
    return SslResponse{false};
  }
  throw FramingError("invalid SSL response byte " + printable_tag(data[0]));
}

}  // namespace framer
}  // namespace pqharness
