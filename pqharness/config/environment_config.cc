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

#include "pqharness/config/environment_config.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <sstream>

#include "pqharness/common/exceptions.hpp"
#include "pqharness/diagnostics/error_handler.hpp"

namespace pqharness {
namespace config {

EnvironmentConfig::EnvironmentConfig(Lookup lookup) : lookup_(std::move(lookup)) {}

EnvironmentConfig::Lookup EnvironmentConfig::process_environment() {
  return [](const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || *value == '\0') {
      return std::nullopt;
    }
    return std::string(value);
  };
}

std::optional<std::string> EnvironmentConfig::get(const std::string& name) const {
  if (!lookup_) {
    return std::nullopt;
  }
  auto value = lookup_(name);
  if (value && value->empty()) {
    return std::nullopt;
  }
  return value;
}

int EnvironmentConfig::parse_timeout_seconds(const std::string& raw) {
  // Surrounding whitespace is tolerated, anything else is not.
  auto first = raw.find_first_not_of(" \t\r\n");
  auto last = raw.find_last_not_of(" \t\r\n");
  if (first == std::string::npos) {
    throw common::ConfigurationError("empty value", kTimeoutVariable);
  }
  std::string trimmed = raw.substr(first, last - first + 1);

  errno = 0;
  char* end = nullptr;
  long value = std::strtol(trimmed.c_str(), &end, 10);
  if (end == trimmed.c_str() || *end != '\0') {
    throw common::ConfigurationError("invalid literal for an integer: '" + raw + "'", kTimeoutVariable);
  }
  if (errno == ERANGE || value > INT_MAX) {
    throw common::ConfigurationError("value out of range: '" + raw + "'", kTimeoutVariable);
  }
  if (value <= 0) {
    throw common::ConfigurationError("timeout must be positive: '" + raw + "'", kTimeoutVariable);
  }
  return static_cast<int>(value);
}

ValidationResult EnvironmentConfig::validate_timeout(const std::string& raw) {
  try {
    parse_timeout_seconds(raw);
  } catch (const common::ConfigurationError& e) {
    return ValidationResult::error(e.what());
  }
  return ValidationResult::success();
}

std::chrono::seconds EnvironmentConfig::timeout_default() const {
  auto raw = get(kTimeoutVariable);
  if (!raw) {
    return std::chrono::seconds(kDefaultTimeoutSeconds);
  }

  try {
    return std::chrono::seconds(parse_timeout_seconds(*raw));
  } catch (const common::ConfigurationError& e) {
    diagnostics::error_reporting::report_configuration_warning(
        "configuration", "timeout_default", std::string(kTimeoutVariable) + " could not be parsed: " + e.what());
    return std::chrono::seconds(kDefaultTimeoutSeconds);
  }
}

std::vector<std::string> EnvironmentConfig::test_extras() const {
  std::vector<std::string> extras;
  auto raw = get(kExtraVariable);
  if (!raw) {
    return extras;
  }

  std::istringstream stream(*raw);
  std::string token;
  while (stream >> token) {
    extras.push_back(token);
  }
  return extras;
}

bool EnvironmentConfig::has_test_extra(const std::string& key) const {
  auto extras = test_extras();
  return std::find(extras.begin(), extras.end(), key) != extras.end();
}

bool EnvironmentConfig::require_test_extra(std::initializer_list<std::string> keys) const {
  return std::all_of(keys.begin(), keys.end(), [this](const std::string& key) { return has_test_extra(key); });
}

std::optional<TlsMaterial> EnvironmentConfig::tls_material() const {
  auto cert = get(kSslCertVariable);
  auto key = get(kSslKeyVariable);
  auto root = get(kSslRootCertVariable);
  if (!cert || !key || !root) {
    return std::nullopt;
  }
  TlsMaterial material;
  material.cert_file = *cert;
  material.key_file = *key;
  material.root_cert_file = *root;
  if (auto host = get(kSslServerHostVariable)) {
    material.server_host = *host;
  }
  return material;
}

}  // namespace config
}  // namespace pqharness
