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

#include <cstdint>
#include <string>

namespace pqharness {
namespace config {

enum class EndpointKind { Unix, Tcp };

struct ServerConfig {
  EndpointKind kind = EndpointKind::Unix;

  // UNIX-domain endpoint: <socket_dir>/.s.PGSQL.<port>
  std::string socket_dir;
  uint16_t port = 5432;

  // TCP endpoint; port 0 lets the OS pick an ephemeral port
  std::string bind_address = "127.0.0.1";

  int backlog = 1;

  static ServerConfig unix_socket(const std::string& dir, uint16_t port = 5432) {
    ServerConfig cfg;
    cfg.kind = EndpointKind::Unix;
    cfg.socket_dir = dir;
    cfg.port = port;
    return cfg;
  }

  static ServerConfig tcp_loopback() {
    ServerConfig cfg;
    cfg.kind = EndpointKind::Tcp;
    cfg.port = 0;
    return cfg;
  }

  std::string unix_socket_path() const { return socket_dir + "/.s.PGSQL." + std::to_string(port); }

  bool is_valid() const {
    if (backlog <= 0) return false;
    if (kind == EndpointKind::Unix) {
      return !socket_dir.empty() && port > 0;
    }
    return !bind_address.empty();
  }
};

}  // namespace config
}  // namespace pqharness
