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

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "pqharness/base/visibility.hpp"

namespace pqharness {
namespace framer {

namespace tag {
constexpr uint8_t kAuthentication = 'R';
constexpr uint8_t kParameterStatus = 'S';
constexpr uint8_t kBackendKeyData = 'K';
constexpr uint8_t kReadyForQuery = 'Z';
constexpr uint8_t kQuery = 'Q';
constexpr uint8_t kEmptyQueryResponse = 'I';
constexpr uint8_t kTerminate = 'X';
constexpr uint8_t kErrorResponse = 'E';
}  // namespace tag

constexpr uint16_t kProtocolMajor = 3;
constexpr uint16_t kProtocolMinor = 0;

// SSLRequest sends this "version" in place of a protocol version.
constexpr uint16_t kSslRequestMajor = 1234;
constexpr uint16_t kSslRequestMinor = 5679;

constexpr uint8_t kSslAccept = 'S';
constexpr uint8_t kSslReject = 'N';

// Transaction status carried by ReadyForQuery
constexpr uint8_t kTransactionIdle = 'I';
constexpr uint8_t kTransactionInBlock = 'T';
constexpr uint8_t kTransactionFailed = 'E';

struct StartupPacket {
  uint16_t major = kProtocolMajor;
  uint16_t minor = kProtocolMinor;
  std::vector<std::pair<std::string, std::string>> parameters;

  bool operator==(const StartupPacket& other) const {
    return major == other.major && minor == other.minor && parameters == other.parameters;
  }
};

struct SslRequest {
  bool operator==(const SslRequest&) const { return true; }
};

struct SslResponse {
  bool accept = false;

  bool operator==(const SslResponse& other) const { return accept == other.accept; }
};

struct AuthenticationOk {
  bool operator==(const AuthenticationOk&) const { return true; }
};

struct ParameterStatus {
  std::string key;
  std::string value;

  bool operator==(const ParameterStatus& other) const { return key == other.key && value == other.value; }
};

struct BackendKeyData {
  uint32_t pid = 0;
  uint32_t secret = 0;

  bool operator==(const BackendKeyData& other) const { return pid == other.pid && secret == other.secret; }
};

struct ReadyForQuery {
  uint8_t status = kTransactionIdle;

  bool operator==(const ReadyForQuery& other) const { return status == other.status; }
};

struct SimpleQuery {
  std::string text;

  bool operator==(const SimpleQuery& other) const { return text == other.text; }
};

struct EmptyQueryResponse {
  bool operator==(const EmptyQueryResponse&) const { return true; }
};

struct Terminate {
  bool operator==(const Terminate&) const { return true; }
};

/**
 * Pre-3.0 error report: 'E' followed by a NUL-terminated message and no
 * length word. Clients still accept it during startup.
 */
struct LegacyErrorResponse {
  std::string message;

  bool operator==(const LegacyErrorResponse& other) const { return message == other.message; }
};

using WireMessage = std::variant<StartupPacket, SslRequest, SslResponse, AuthenticationOk, ParameterStatus,
                                 BackendKeyData, ReadyForQuery, SimpleQuery, EmptyQueryResponse, Terminate,
                                 LegacyErrorResponse>;

/**
 * Short name of the message type, for logs and error messages
 */
PQHARNESS_API std::string message_name(const WireMessage& message);

}  // namespace framer
}  // namespace pqharness
