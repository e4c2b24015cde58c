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

#include "pqharness/diagnostics/error_handler.hpp"

#include <iostream>

#include "pqharness/diagnostics/logger.hpp"

namespace pqharness {
namespace diagnostics {

ErrorHandler::ErrorHandler() = default;
ErrorHandler::~ErrorHandler() = default;

ErrorHandler& ErrorHandler::instance() {
  static ErrorHandler instance;
  return instance;
}

void ErrorHandler::report_error(const ErrorInfo& error) {
  if (!enabled_.load()) {
    return;
  }

  if (error.level < min_level_.load()) {
    return;
  }

  log_error(error);

  std::vector<ErrorCallback> callbacks_copy;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    update_stats(error);
    recent_errors_.push_back(error);
    if (recent_errors_.size() > MAX_RECENT_ERRORS) {
      recent_errors_.erase(recent_errors_.begin());
    }
    callbacks_copy = callbacks_;
  }
  notify_callbacks(callbacks_copy, error);
}

void ErrorHandler::register_callback(ErrorCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.push_back(std::move(callback));
}

void ErrorHandler::clear_callbacks() {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.clear();
}

void ErrorHandler::set_min_error_level(ErrorLevel level) { min_level_.store(level); }

ErrorLevel ErrorHandler::get_min_error_level() const { return min_level_.load(); }

void ErrorHandler::set_enabled(bool enabled) { enabled_.store(enabled); }

bool ErrorHandler::is_enabled() const { return enabled_.load(); }

ErrorStats ErrorHandler::get_error_stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

void ErrorHandler::reset_stats() {
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.reset();
  }
  std::lock_guard<std::mutex> lock(mutex_);
  recent_errors_.clear();
}

std::vector<ErrorInfo> ErrorHandler::get_recent_errors(size_t count) const {
  std::lock_guard<std::mutex> lock(mutex_);

  size_t start_index = 0;
  if (recent_errors_.size() > count) {
    start_index = recent_errors_.size() - count;
  }

  return std::vector<ErrorInfo>(recent_errors_.begin() + static_cast<std::ptrdiff_t>(start_index),
                                recent_errors_.end());
}

bool ErrorHandler::has_errors(const std::string& component) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& error : recent_errors_) {
    if (error.component == component) {
      return true;
    }
  }
  return false;
}

void ErrorHandler::update_stats(const ErrorInfo& error) {
  std::lock_guard<std::mutex> lock(stats_mutex_);

  stats_.total_errors++;
  stats_.errors_by_level[static_cast<size_t>(error.level)]++;
  stats_.errors_by_category[static_cast<size_t>(error.category)]++;
}

void ErrorHandler::notify_callbacks(const std::vector<ErrorCallback>& callbacks, const ErrorInfo& error) {
  for (const auto& callback : callbacks) {
    try {
      callback(error);
    } catch (const std::exception& e) {
      std::cerr << "Error in error callback: " << e.what() << std::endl;
    }
  }
}

void ErrorHandler::log_error(const ErrorInfo& error) {
  std::string message = error.message;
  if (error.boost_error) {
    message += " (boost: " + error.boost_error.message() + ")";
  }

  switch (error.level) {
    case ErrorLevel::INFO:
      PQHARNESS_LOG_INFO(error.component, error.operation, message);
      break;
    case ErrorLevel::WARNING:
      PQHARNESS_LOG_WARNING(error.component, error.operation, message);
      break;
    case ErrorLevel::ERROR:
      PQHARNESS_LOG_ERROR(error.component, error.operation, message);
      break;
    case ErrorLevel::CRITICAL:
      PQHARNESS_LOG_CRITICAL(error.component, error.operation, message);
      break;
  }
}

namespace error_reporting {

void report_configuration_warning(const std::string& component, const std::string& operation,
                                  const std::string& message) {
  ErrorInfo error(ErrorLevel::WARNING, ErrorCategory::CONFIGURATION, component, operation, message);
  ErrorHandler::instance().report_error(error);
}

void report_release_error(const std::string& component, const std::string& operation, const std::string& message) {
  ErrorInfo error(ErrorLevel::ERROR, ErrorCategory::RELEASE, component, operation, message);
  ErrorHandler::instance().report_error(error);
}

void report_framing_error(const std::string& component, const std::string& operation, const std::string& message) {
  ErrorInfo error(ErrorLevel::ERROR, ErrorCategory::FRAMING, component, operation, message);
  ErrorHandler::instance().report_error(error);
}

void report_connection_error(const std::string& component, const std::string& operation,
                             const std::string& message) {
  ErrorInfo error(ErrorLevel::ERROR, ErrorCategory::CONNECTION, component, operation, message);
  ErrorHandler::instance().report_error(error);
}

void report_query_error(const std::string& component, const std::string& operation, const std::string& message) {
  ErrorInfo error(ErrorLevel::ERROR, ErrorCategory::QUERY, component, operation, message);
  ErrorHandler::instance().report_error(error);
}

void report_timeout(const std::string& component, const std::string& operation, const std::string& message) {
  ErrorInfo error(ErrorLevel::ERROR, ErrorCategory::TIMEOUT, component, operation, message);
  ErrorHandler::instance().report_error(error);
}

void report_system_error(const std::string& component, const std::string& operation, const std::string& message,
                         const boost::system::error_code& ec) {
  ErrorInfo error(ErrorLevel::ERROR, ErrorCategory::SYSTEM, component, operation, message, ec);
  ErrorHandler::instance().report_error(error);
}

void report_leak(const std::string& component, const std::string& operation, const std::string& message) {
  ErrorInfo error(ErrorLevel::CRITICAL, ErrorCategory::RELEASE, component, operation, message);
  ErrorHandler::instance().report_error(error);
}

}  // namespace error_reporting

}  // namespace diagnostics
}  // namespace pqharness
