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

#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstddef>
#include <sstream>
#include <string>

namespace pqharness {
namespace diagnostics {

/**
 * @brief Error severity levels
 */
enum class ErrorLevel {
  INFO = 0,     // Informational message
  WARNING = 1,  // Recoverable, a default was substituted
  ERROR = 2,    // Test failure
  CRITICAL = 3  // Resource leaked or harness state is unreliable
};

/**
 * @brief Error categories for classification
 */
enum class ErrorCategory {
  CONFIGURATION = 0,  // Environment values
  FRAMING = 1,        // Wire protocol violations
  TIMEOUT = 2,        // Budget exceeded
  CONNECTION = 3,     // Native client connection failures
  QUERY = 4,          // Native client query failures
  RELEASE = 5,        // Teardown failures
  SYSTEM = 6,         // OS level errors (bind, accept, socket I/O)
  UNKNOWN = 7
};

constexpr size_t kErrorLevelCount = 4;
constexpr size_t kErrorCategoryCount = 8;

/**
 * @brief Error information recorded by the ErrorHandler
 */
struct ErrorInfo {
  ErrorLevel level;
  ErrorCategory category;
  std::string component;  // background_server, resource_stack, client, ...
  std::string operation;  // bind, accept, join, release, ...
  std::string message;
  boost::system::error_code boost_error;
  std::chrono::system_clock::time_point timestamp;

  ErrorInfo(ErrorLevel l, ErrorCategory c, const std::string& comp, const std::string& op, const std::string& msg)
      : level(l), category(c), component(comp), operation(op), message(msg), timestamp(std::chrono::system_clock::now()) {}

  ErrorInfo(ErrorLevel l, ErrorCategory c, const std::string& comp, const std::string& op, const std::string& msg,
            const boost::system::error_code& ec)
      : level(l),
        category(c),
        component(comp),
        operation(op),
        message(msg),
        boost_error(ec),
        timestamp(std::chrono::system_clock::now()) {}

  std::string get_level_string() const {
    switch (level) {
      case ErrorLevel::INFO:
        return "INFO";
      case ErrorLevel::WARNING:
        return "WARNING";
      case ErrorLevel::ERROR:
        return "ERROR";
      case ErrorLevel::CRITICAL:
        return "CRITICAL";
    }
    return "UNKNOWN";
  }

  std::string get_category_string() const {
    switch (category) {
      case ErrorCategory::CONFIGURATION:
        return "CONFIGURATION";
      case ErrorCategory::FRAMING:
        return "FRAMING";
      case ErrorCategory::TIMEOUT:
        return "TIMEOUT";
      case ErrorCategory::CONNECTION:
        return "CONNECTION";
      case ErrorCategory::QUERY:
        return "QUERY";
      case ErrorCategory::RELEASE:
        return "RELEASE";
      case ErrorCategory::SYSTEM:
        return "SYSTEM";
      case ErrorCategory::UNKNOWN:
        return "UNKNOWN";
    }
    return "UNKNOWN";
  }

  std::string get_summary() const {
    std::ostringstream oss;
    oss << "[" << get_level_string() << "] " << "[" << component << "] " << "[" << operation << "] " << message;

    if (boost_error) {
      oss << " (boost: " << boost_error.message() << ", code: " << boost_error.value() << ")";
    }

    return oss.str();
  }
};

/**
 * @brief Error statistics
 */
struct ErrorStats {
  size_t total_errors = 0;
  size_t errors_by_level[kErrorLevelCount] = {0, 0, 0, 0};
  size_t errors_by_category[kErrorCategoryCount] = {0, 0, 0, 0, 0, 0, 0, 0};

  void reset() { *this = ErrorStats{}; }
};

}  // namespace diagnostics
}  // namespace pqharness
