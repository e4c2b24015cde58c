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

#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "pqharness/base/visibility.hpp"

namespace pqharness {
namespace client {

/**
 * @brief Connection parameters in insertion order
 *
 * Setting an existing key replaces its value without moving it.
 */
class PQHARNESS_API ConnectionOptions {
 public:
  using Entry = std::pair<std::string, std::string>;

  ConnectionOptions() = default;
  ConnectionOptions(std::initializer_list<Entry> entries);
  explicit ConnectionOptions(const std::vector<Entry>& entries);

  ConnectionOptions& set(const std::string& key, const std::string& value);
  ConnectionOptions& set(const std::string& key, const char* value) { return set(key, std::string(value)); }
  ConnectionOptions& set(const std::string& key, long long value);
  ConnectionOptions& set(const std::string& key, int value) { return set(key, static_cast<long long>(value)); }

  /**
   * @brief Append every entry of other, replacing keys already present
   */
  ConnectionOptions& merge(const ConnectionOptions& other);

  bool has(const std::string& key) const;
  std::optional<std::string> get(const std::string& key) const;

  const std::vector<Entry>& entries() const { return entries_; }
  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

 private:
  std::vector<Entry> entries_;
};

/**
 * @brief Quote one value for a key=value connection string
 *
 * Empty becomes '', backslash and single quote are escaped, and a value
 * containing whitespace is wrapped in single quotes.
 */
PQHARNESS_API std::string quote_connection_value(const std::string& value);

/**
 * @brief Flatten options into "k1=v1 k2=v2 ..." in insertion order
 */
PQHARNESS_API std::string build_connection_string(const ConnectionOptions& options);

}  // namespace client
}  // namespace pqharness
