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

#include "pqharness/client/connection_options.hpp"

#include <algorithm>
#include <cctype>

namespace pqharness {
namespace client {

ConnectionOptions::ConnectionOptions(std::initializer_list<Entry> entries) {
  for (const auto& entry : entries) {
    set(entry.first, entry.second);
  }
}

ConnectionOptions::ConnectionOptions(const std::vector<Entry>& entries) {
  for (const auto& entry : entries) {
    set(entry.first, entry.second);
  }
}

ConnectionOptions& ConnectionOptions::set(const std::string& key, const std::string& value) {
  auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& e) { return e.first == key; });
  if (it != entries_.end()) {
    it->second = value;
  } else {
    entries_.emplace_back(key, value);
  }
  return *this;
}

ConnectionOptions& ConnectionOptions::set(const std::string& key, long long value) {
  return set(key, std::to_string(value));
}

ConnectionOptions& ConnectionOptions::merge(const ConnectionOptions& other) {
  for (const auto& entry : other.entries_) {
    set(entry.first, entry.second);
  }
  return *this;
}

bool ConnectionOptions::has(const std::string& key) const { return get(key).has_value(); }

std::optional<std::string> ConnectionOptions::get(const std::string& key) const {
  for (const auto& entry : entries_) {
    if (entry.first == key) {
      return entry.second;
    }
  }
  return std::nullopt;
}

std::string quote_connection_value(const std::string& value) {
  if (value.empty()) {
    return "''";
  }

  std::string escaped;
  escaped.reserve(value.size() + 2);
  bool needs_quotes = false;
  for (char c : value) {
    if (c == '\\' || c == '\'') {
      escaped.push_back('\\');
    } else if (std::isspace(static_cast<unsigned char>(c))) {
      needs_quotes = true;
    }
    escaped.push_back(c);
  }

  if (needs_quotes) {
    return "'" + escaped + "'";
  }
  return escaped;
}

std::string build_connection_string(const ConnectionOptions& options) {
  std::string result;
  for (const auto& entry : options.entries()) {
    if (!result.empty()) {
      result.push_back(' ');
    }
    result += entry.first;
    result.push_back('=');
    result += quote_connection_value(entry.second);
  }
  return result;
}

}  // namespace client
}  // namespace pqharness
