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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <optional>
#include <string>

#include "pqharness/client/libpq_client.hpp"
#include "pqharness/common/exceptions.hpp"
#include "pqharness/config/environment_config.hpp"
#include "pqharness/diagnostics/logger.hpp"
#include "pqharness/server/background_server.hpp"
#include "pqharness/transport/tls_context.hpp"
#include "test_constants.hpp"
#include "test_utils.hpp"

using namespace pqharness;
using namespace pqharness::test;
using client::ConnectionOptions;
using client::Libpq;
using server::BackgroundServer;
using transport::PeerConnection;
using ::testing::HasSubstr;

/**
 * @brief libpq TLS negotiation against a scripted TCP server
 *
 * Runs only with PG_TEST_EXTRA=ssl and a libpq built with SSL support.
 */
class SslClientTest : public ::testing::Test {
 protected:
  void SetUp() override {
    PQHARNESS_REQUIRE_TEST_EXTRA("ssl");
    Libpq probe(budget());
    if (!probe.ssl_supported()) {
      GTEST_SKIP() << "libpq was built without SSL support";
    }
    material_ = config::EnvironmentConfig().tls_material();
    diagnostics::Logger::instance().set_console_output(false);
  }

  void TearDown() override { diagnostics::Logger::instance().set_console_output(true); }

  static timing::TimeoutBudget budget() { return timing::TimeoutBudget(constants::kScenarioBudget); }

  std::optional<config::TlsMaterial> material_;
};

class SslDisabledServerTest : public SslClientTest, public ::testing::WithParamInterface<std::string> {};

TEST_P(SslDisabledServerTest, ClientRefusesPlaintextFallback) {
  BackgroundServer server(config::ServerConfig::tcp_loopback(), budget());
  server.bind_and_listen();
  server.run_in_background([](PeerConnection& peer) {
    peer.expect_ssl_request();
    peer.send(framer::SslResponse{false});
    peer.expect_eof();
  });

  ConnectionOptions options(server.conninfo());
  options.set("sslmode", GetParam()).set("gssencmode", "disable");
  if (material_) {
    options.set("sslrootcert", material_->root_cert_file);
  }

  Libpq libpq(budget());
  try {
    libpq.must_connect(options);
    FAIL() << "expected ConnectionError";
  } catch (const common::ConnectionError& e) {
    EXPECT_THAT(e.what(), HasSubstr("server does not support SSL"));
  }
  libpq.close();

  EXPECT_NO_THROW(server.join_and_propagate());
}

INSTANTIATE_TEST_SUITE_P(SslModes, SslDisabledServerTest, ::testing::Values("require", "verify-ca", "verify-full"));

TEST_F(SslClientTest, VerifyFullEmptyQuery) {
  if (!material_) {
    GTEST_SKIP() << "PG_TEST_SSL_CERT, PG_TEST_SSL_KEY and PG_TEST_SSL_ROOT_CERT are not set";
  }

  BackgroundServer server(config::ServerConfig::tcp_loopback(), budget());
  server.bind_and_listen();
  server.run_in_background_tls(transport::make_server_tls_context(*material_), [](PeerConnection& peer) {
    if (!peer.is_tls()) {
      throw common::PeerAssertionError("handler did not get an encrypted connection", "expect_tls");
    }
    peer.expect_startup(3, 0);
    peer.send(framer::AuthenticationOk{});
    peer.send(framer::ParameterStatus{"client_encoding", "UTF-8"});
    peer.send(framer::ParameterStatus{"DateStyle", "ISO, MDY"});
    peer.send(framer::BackendKeyData{1234, 1234});
    peer.send(framer::ReadyForQuery{framer::kTransactionIdle});

    auto query = peer.expect_query();
    if (!query.text.empty()) {
      throw common::PeerAssertionError("expected an empty query, got '" + query.text + "'", "expect_query");
    }
    peer.send(framer::EmptyQueryResponse{});
    peer.send(framer::ReadyForQuery{framer::kTransactionIdle});

    peer.expect_terminate();
    peer.expect_eof();
  });

  ConnectionOptions options(server.conninfo());
  options.set("host", material_->server_host)
      .set("sslrootcert", material_->root_cert_file)
      .set("sslmode", "verify-full")
      .set("gssencmode", "disable");

  Libpq libpq(budget());
  auto& conn = libpq.must_connect(options);
  EXPECT_EQ(conn.exec("").status(), client::kEmptyQuery);
  libpq.close();

  EXPECT_NO_THROW(server.join_and_propagate());
}
