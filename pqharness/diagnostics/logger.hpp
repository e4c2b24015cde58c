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

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "pqharness/base/visibility.hpp"

#ifdef DEBUG
#undef DEBUG
#endif
#ifdef INFO
#undef INFO
#endif
#ifdef WARNING
#undef WARNING
#endif
#ifdef ERROR
#undef ERROR
#endif
#ifdef CRITICAL
#undef CRITICAL
#endif
#ifdef CALLBACK
#undef CALLBACK
#endif

namespace pqharness {
namespace diagnostics {

/**
 * @brief Log severity levels
 */
enum class LogLevel { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, CRITICAL = 4 };

/**
 * @brief Log output destinations
 */
enum class LogOutput { CONSOLE = 0x01, FILE = 0x02, CALLBACK = 0x04 };

/**
 * @brief Parse a level name ("debug", "INFO", ...) case-insensitively
 */
PQHARNESS_API std::optional<LogLevel> parse_log_level(std::string_view name);

/**
 * @brief Centralized logging system
 *
 * Thread-safe: the test thread and the background server worker both log
 * through the same instance. Formatting follows the placeholder string set
 * with set_format().
 */
class PQHARNESS_API Logger {
 public:
  using LogCallback = std::function<void(LogLevel level, const std::string& formatted_message)>;

  /**
   * @brief Get process-wide instance
   */
  static Logger& instance();

  Logger();
  ~Logger();

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  /**
   * @brief Set minimum log level
   * @param level Messages below this level will be ignored
   */
  void set_level(LogLevel level);
  LogLevel get_level() const;

  /**
   * @brief Enable/disable console output
   */
  void set_console_output(bool enable);

  /**
   * @brief Set file output
   * @param filename Log file path (empty string to disable file output)
   */
  void set_file_output(const std::string& filename);

  /**
   * @brief Set log callback
   * @param callback Function to call for each log message (empty to disable)
   */
  void set_callback(LogCallback callback);

  void set_enabled(bool enabled);
  bool is_enabled() const;

  /**
   * @brief Set log format
   * @param format Format string with placeholders: {timestamp}, {level}, {component}, {operation}, {message}
   */
  void set_format(const std::string& format);

  void flush();

  void log(LogLevel level, std::string_view component, std::string_view operation, std::string_view message);

  void debug(std::string_view component, std::string_view operation, std::string_view message);
  void info(std::string_view component, std::string_view operation, std::string_view message);
  void warning(std::string_view component, std::string_view operation, std::string_view message);
  void error(std::string_view component, std::string_view operation, std::string_view message);
  void critical(std::string_view component, std::string_view operation, std::string_view message);

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

/**
 * @brief Convenience macros for logging
 */
#define PQHARNESS_LOG_DEBUG(component, operation, message)                                                   \
  do {                                                                                                       \
    if (pqharness::diagnostics::Logger::instance().get_level() <= pqharness::diagnostics::LogLevel::DEBUG) { \
      pqharness::diagnostics::Logger::instance().debug(component, operation, message);                     \
    }                                                                                                        \
  } while (0)

#define PQHARNESS_LOG_INFO(component, operation, message)                                                   \
  do {                                                                                                      \
    if (pqharness::diagnostics::Logger::instance().get_level() <= pqharness::diagnostics::LogLevel::INFO) { \
      pqharness::diagnostics::Logger::instance().info(component, operation, message);                     \
    }                                                                                                       \
  } while (0)

#define PQHARNESS_LOG_WARNING(component, operation, message)                                                   \
  do {                                                                                                         \
    if (pqharness::diagnostics::Logger::instance().get_level() <= pqharness::diagnostics::LogLevel::WARNING) { \
      pqharness::diagnostics::Logger::instance().warning(component, operation, message);                     \
    }                                                                                                          \
  } while (0)

#define PQHARNESS_LOG_ERROR(component, operation, message)                                                   \
  do {                                                                                                       \
    if (pqharness::diagnostics::Logger::instance().get_level() <= pqharness::diagnostics::LogLevel::ERROR) { \
      pqharness::diagnostics::Logger::instance().error(component, operation, message);                     \
    }                                                                                                        \
  } while (0)

#define PQHARNESS_LOG_CRITICAL(component, operation, message)                                                   \
  do {                                                                                                          \
    if (pqharness::diagnostics::Logger::instance().get_level() <= pqharness::diagnostics::LogLevel::CRITICAL) { \
      pqharness::diagnostics::Logger::instance().critical(component, operation, message);                     \
    }                                                                                                           \
  } while (0)

}  // namespace diagnostics
}  // namespace pqharness
