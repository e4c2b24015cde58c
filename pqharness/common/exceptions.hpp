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
#include <stdexcept>
#include <string>

#include "pqharness/base/error_codes.hpp"

namespace pqharness {
namespace common {

/**
 * @brief Base exception class for all pqharness errors
 *
 * Carries the component and operation that failed along with a
 * structured ErrorCode, so failures captured on the background worker
 * can be attributed when they are re-raised on the test thread.
 */
class HarnessException : public std::runtime_error {
 public:
  explicit HarnessException(const std::string& message, const std::string& component = "",
                            const std::string& operation = "", ErrorCode code = ErrorCode::Unknown)
      : std::runtime_error(message), component_(component), operation_(operation), code_(code) {}

  const std::string& get_component() const noexcept { return component_; }
  const std::string& get_operation() const noexcept { return operation_; }
  ErrorCode get_code() const noexcept { return code_; }

  std::string get_full_message() const {
    std::string full_msg = what();
    if (!component_.empty()) {
      full_msg = "[" + component_ + "] " + full_msg;
    }
    if (!operation_.empty()) {
      full_msg += " (operation: " + operation_ + ")";
    }
    return full_msg;
  }

 private:
  std::string component_;
  std::string operation_;
  ErrorCode code_;
};

/**
 * @brief Bad or missing environment configuration
 *
 * Never fatal on its own: configuration readers catch it, log a warning
 * and fall back to the default value.
 */
class ConfigurationError : public HarnessException {
 public:
  explicit ConfigurationError(const std::string& message, const std::string& variable = "")
      : HarnessException(message, "configuration", "parse", ErrorCode::InvalidConfiguration), variable_(variable) {}

  const std::string& get_variable() const noexcept { return variable_; }

 private:
  std::string variable_;
};

/**
 * @brief Declared length mismatch or unexpected byte sequence on the wire
 */
class FramingError : public HarnessException {
 public:
  explicit FramingError(const std::string& message, const std::string& operation = "decode", size_t offset = 0)
      : HarnessException(message, "framer", operation, ErrorCode::FramingViolation), offset_(offset) {}

  size_t get_offset() const noexcept { return offset_; }

 private:
  size_t offset_;
};

/**
 * @brief Accept, read/write or join exceeded its time budget
 */
class TimeoutError : public HarnessException {
 public:
  explicit TimeoutError(const std::string& message, const std::string& component = "",
                        const std::string& operation = "")
      : HarnessException(message, component, operation, ErrorCode::TimedOut) {}
};

/**
 * @brief Mock server setup or state machine failure (bind, listen, accept)
 */
class ServerError : public HarnessException {
 public:
  explicit ServerError(const std::string& message, const std::string& operation = "",
                       ErrorCode code = ErrorCode::IoError)
      : HarnessException(message, "background_server", operation, code) {}
};

/**
 * @brief A scripted peer expectation did not hold
 */
class PeerAssertionError : public HarnessException {
 public:
  explicit PeerAssertionError(const std::string& message, const std::string& operation = "expect")
      : HarnessException(message, "peer", operation, ErrorCode::PeerAssertion) {}
};

/**
 * @brief The native client reported a non-OK connection status
 *
 * what() is the client library's own error text.
 */
class ConnectionError : public HarnessException {
 public:
  explicit ConnectionError(const std::string& message, const std::string& conninfo = "")
      : HarnessException(message, "client", "connect", ErrorCode::ConnectionFailed), conninfo_(conninfo) {}

  const std::string& get_conninfo() const noexcept { return conninfo_; }

 private:
  std::string conninfo_;
};

/**
 * @brief The native client produced no result or a failed result
 */
class QueryError : public HarnessException {
 public:
  explicit QueryError(const std::string& message, const std::string& query = "", int result_status = -1)
      : HarnessException(message, "client", "exec", ErrorCode::QueryFailed),
        query_(query),
        result_status_(result_status) {}

  const std::string& get_query() const noexcept { return query_; }
  int get_result_status() const noexcept { return result_status_; }

 private:
  std::string query_;
  int result_status_;
};

}  // namespace common
}  // namespace pqharness
