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

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "pqharness/base/visibility.hpp"
#include "pqharness/diagnostics/error_types.hpp"

namespace pqharness {
namespace diagnostics {

/**
 * @brief Centralized error recorder
 *
 * Failures that cannot be thrown (secondary release errors, errors seen
 * in destructors, abandoned background workers) are reported here so they
 * are flagged rather than hidden. Every report is also logged.
 */
class PQHARNESS_API ErrorHandler {
 public:
  using ErrorCallback = std::function<void(const ErrorInfo&)>;

  static ErrorHandler& instance();

  ErrorHandler();
  ~ErrorHandler();

  ErrorHandler(const ErrorHandler&) = delete;
  ErrorHandler& operator=(const ErrorHandler&) = delete;

  /**
   * @brief Report an error
   * @param error Error information to report
   */
  void report_error(const ErrorInfo& error);

  /**
   * @brief Register error callback
   * @param callback Function to call when errors occur
   */
  void register_callback(ErrorCallback callback);
  void clear_callbacks();

  /**
   * @brief Set minimum error level to report
   */
  void set_min_error_level(ErrorLevel level);
  ErrorLevel get_min_error_level() const;

  void set_enabled(bool enabled);
  bool is_enabled() const;

  ErrorStats get_error_stats() const;
  void reset_stats();

  /**
   * @brief Get recent errors
   * @param count Maximum number of recent errors to return
   */
  std::vector<ErrorInfo> get_recent_errors(size_t count = 10) const;

  /**
   * @brief Check if component has any recorded errors
   */
  bool has_errors(const std::string& component) const;

 private:
  mutable std::mutex mutex_;
  std::vector<ErrorCallback> callbacks_;
  std::atomic<ErrorLevel> min_level_{ErrorLevel::INFO};
  std::atomic<bool> enabled_{true};

  mutable std::mutex stats_mutex_;
  ErrorStats stats_;
  std::vector<ErrorInfo> recent_errors_;

  static constexpr size_t MAX_RECENT_ERRORS = 1000;

  void update_stats(const ErrorInfo& error);
  void notify_callbacks(const std::vector<ErrorCallback>& callbacks, const ErrorInfo& error);
  void log_error(const ErrorInfo& error);
};

/**
 * @brief Convenience functions for common error reporting scenarios
 */
namespace error_reporting {

PQHARNESS_API void report_configuration_warning(const std::string& component, const std::string& operation,
                                                const std::string& message);

PQHARNESS_API void report_release_error(const std::string& component, const std::string& operation,
                                        const std::string& message);

PQHARNESS_API void report_framing_error(const std::string& component, const std::string& operation,
                                        const std::string& message);

PQHARNESS_API void report_connection_error(const std::string& component, const std::string& operation,
                                           const std::string& message);

PQHARNESS_API void report_query_error(const std::string& component, const std::string& operation,
                                      const std::string& message);

PQHARNESS_API void report_timeout(const std::string& component, const std::string& operation,
                                  const std::string& message);

PQHARNESS_API void report_system_error(const std::string& component, const std::string& operation,
                                       const std::string& message,
                                       const boost::system::error_code& ec = boost::system::error_code{});

/**
 * @brief Report a resource that could not be reclaimed
 */
PQHARNESS_API void report_leak(const std::string& component, const std::string& operation,
                               const std::string& message);

}  // namespace error_reporting

}  // namespace diagnostics
}  // namespace pqharness
