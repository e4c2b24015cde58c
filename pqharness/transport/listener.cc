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

#include "pqharness/transport/listener.hpp"

#include "pqharness/common/exceptions.hpp"
#include "pqharness/transport/boost_listener.hpp"

namespace pqharness {
namespace transport {

std::unique_ptr<Listener> make_listener(const config::ServerConfig& cfg, std::shared_ptr<net::io_context> ioc) {
  if (!cfg.is_valid()) {
    throw common::ServerError("invalid server configuration", "configure", ErrorCode::InvalidConfiguration);
  }

  if (cfg.kind == config::EndpointKind::Unix) {
    net::local::stream_protocol::endpoint endpoint;
    try {
      endpoint.path(cfg.unix_socket_path());
    } catch (const boost::system::system_error& e) {
      throw common::ServerError("cannot use socket path " + cfg.unix_socket_path() + ": " + e.code().message(),
                                "configure", ErrorCode::BindFailed);
    }
    auto listener = std::make_unique<BoostListener<net::local::stream_protocol>>(std::move(ioc), endpoint);
    listener->set_reported_port(cfg.port);
    return listener;
  }

  boost::system::error_code ec;
  auto address = net::ip::make_address(cfg.bind_address, ec);
  if (ec) {
    throw common::ServerError("invalid bind address '" + cfg.bind_address + "': " + ec.message(), "configure",
                              ErrorCode::InvalidConfiguration);
  }
  return std::make_unique<BoostListener<net::ip::tcp>>(std::move(ioc), net::ip::tcp::endpoint(address, cfg.port));
}

}  // namespace transport
}  // namespace pqharness
