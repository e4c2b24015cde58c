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

#include <string>

namespace pqharness {

/**
 * @brief Structured error codes for pqharness
 */
enum class ErrorCode {
  Success = 0,
  Unknown,
  InvalidConfiguration,
  InvalidState,

  // Wire protocol
  FramingViolation,
  PeerAssertion,

  // Mock server
  BindFailed,
  AcceptFailed,
  IoError,
  TimedOut,

  // Native client
  ConnectionFailed,
  QueryFailed,

  // Teardown
  ReleaseFailed
};

/**
 * @brief Convert ErrorCode to human-readable string
 */
inline std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::Success:
      return "Success";
    case ErrorCode::Unknown:
      return "Unknown Error";
    case ErrorCode::InvalidConfiguration:
      return "Invalid Configuration";
    case ErrorCode::InvalidState:
      return "Invalid State";
    case ErrorCode::FramingViolation:
      return "Framing Violation";
    case ErrorCode::PeerAssertion:
      return "Peer Assertion Failed";
    case ErrorCode::BindFailed:
      return "Bind Failed";
    case ErrorCode::AcceptFailed:
      return "Accept Failed";
    case ErrorCode::IoError:
      return "I/O Error";
    case ErrorCode::TimedOut:
      return "Operation Timed Out";
    case ErrorCode::ConnectionFailed:
      return "Connection Failed";
    case ErrorCode::QueryFailed:
      return "Query Failed";
    case ErrorCode::ReleaseFailed:
      return "Release Failed";
    default:
      return "Unknown Error Code";
  }
}

}  // namespace pqharness
