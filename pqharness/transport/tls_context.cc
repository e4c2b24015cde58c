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

#include "pqharness/transport/tls_context.hpp"

#include <string>

#include "pqharness/common/exceptions.hpp"
#include "pqharness/diagnostics/logger.hpp"

namespace pqharness {
namespace transport {

namespace ssl = boost::asio::ssl;

namespace {

void check(const boost::system::error_code& ec, const std::string& what, const std::string& path) {
  if (ec) {
    throw common::ServerError("cannot load " + what + " " + path + ": " + ec.message(), "tls_context",
                              ErrorCode::InvalidConfiguration);
  }
}

}  // namespace

std::shared_ptr<ssl::context> make_server_tls_context(const config::TlsMaterial& material) {
  auto ctx = std::make_shared<ssl::context>(ssl::context::tls_server);
  boost::system::error_code ec;

  ctx->set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                       ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1,
                   ec);
  check(ec, "TLS options", "");

  ctx->use_certificate_chain_file(material.cert_file, ec);
  check(ec, "certificate", material.cert_file);

  ctx->use_private_key_file(material.key_file, ssl::context::pem, ec);
  check(ec, "private key", material.key_file);

  if (!material.root_cert_file.empty()) {
    ctx->load_verify_file(material.root_cert_file, ec);
    check(ec, "root certificate", material.root_cert_file);
  }

  PQHARNESS_LOG_DEBUG("tls", "context", "loaded server certificate " + material.cert_file);
  return ctx;
}

}  // namespace transport
}  // namespace pqharness
