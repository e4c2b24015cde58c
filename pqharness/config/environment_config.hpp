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
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

#include "pqharness/base/visibility.hpp"

namespace pqharness {
namespace config {

/**
 * Configuration validation result
 */
struct ValidationResult {
  bool is_valid;
  std::string error_message;

  explicit ValidationResult(bool valid = true, const std::string& error = "") : is_valid(valid), error_message(error) {}

  static ValidationResult success() { return ValidationResult(true); }
  static ValidationResult error(const std::string& msg) { return ValidationResult(false, msg); }
};

/**
 * PEM files used by TLS scenarios. Generating them is left to the caller.
 */
struct TlsMaterial {
  std::string cert_file;
  std::string key_file;
  std::string root_cert_file;
  // Name the server certificate was issued for; clients verify against it.
  std::string server_host = "localhost";
};

/**
 * Environment-driven harness configuration
 *
 * Every accessor degrades to a safe default when a variable is absent or
 * malformed; a warning is logged and reported, nothing is thrown.
 */
class PQHARNESS_API EnvironmentConfig {
 public:
  using Lookup = std::function<std::optional<std::string>(const std::string& name)>;

  static constexpr const char* kTimeoutVariable = "PG_TEST_TIMEOUT_DEFAULT";
  static constexpr const char* kExtraVariable = "PG_TEST_EXTRA";
  static constexpr const char* kSslCertVariable = "PG_TEST_SSL_CERT";
  static constexpr const char* kSslKeyVariable = "PG_TEST_SSL_KEY";
  static constexpr const char* kSslRootCertVariable = "PG_TEST_SSL_ROOT_CERT";
  static constexpr const char* kSslServerHostVariable = "PG_TEST_SSL_SERVER_HOST";
  static constexpr int kDefaultTimeoutSeconds = 180;

  explicit EnvironmentConfig(Lookup lookup = process_environment());

  /**
   * Lookup backed by std::getenv. Empty values are treated as unset.
   */
  static Lookup process_environment();

  std::optional<std::string> get(const std::string& name) const;

  /**
   * PG_TEST_TIMEOUT_DEFAULT in seconds, or 180 if unset or invalid
   */
  std::chrono::seconds timeout_default() const;

  /**
   * Tokens of PG_TEST_EXTRA, split on whitespace
   */
  std::vector<std::string> test_extras() const;
  bool has_test_extra(const std::string& key) const;

  /**
   * True only when every key is present in PG_TEST_EXTRA
   */
  bool require_test_extra(std::initializer_list<std::string> keys) const;

  /**
   * Certificate, key and root certificate paths, if all three are set.
   * PG_TEST_SSL_SERVER_HOST overrides the certificate host name.
   */
  std::optional<TlsMaterial> tls_material() const;

  /**
   * Parse a timeout value in whole seconds
   * @throws common::ConfigurationError if the value is not a positive integer
   */
  static int parse_timeout_seconds(const std::string& raw);
  static ValidationResult validate_timeout(const std::string& raw);

 private:
  Lookup lookup_;
};

}  // namespace config
}  // namespace pqharness
