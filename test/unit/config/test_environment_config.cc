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

#include <chrono>
#include <string>

#include "pqharness/common/exceptions.hpp"
#include "pqharness/config/environment_config.hpp"
#include "pqharness/config/server_config.hpp"
#include "pqharness/diagnostics/error_handler.hpp"
#include "test_utils.hpp"

using namespace pqharness;
using namespace pqharness::test;
using config::EnvironmentConfig;
using config::ServerConfig;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

class EnvironmentConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { diagnostics::ErrorHandler::instance().reset_stats(); }

  static EnvironmentConfig with(std::map<std::string, std::string> values) {
    return EnvironmentConfig(TestUtils::mapLookup(std::move(values)));
  }
};

// ============================================================================
// PG_TEST_TIMEOUT_DEFAULT
// ============================================================================

TEST_F(EnvironmentConfigTest, TimeoutDefaultsTo180WhenUnset) {
  EXPECT_EQ(with({}).timeout_default(), std::chrono::seconds(180));
}

TEST_F(EnvironmentConfigTest, TimeoutDefaultsTo180WhenEmpty) {
  EXPECT_EQ(with({{"PG_TEST_TIMEOUT_DEFAULT", ""}}).timeout_default(), std::chrono::seconds(180));
}

TEST_F(EnvironmentConfigTest, TimeoutReadsIntegerSeconds) {
  EXPECT_EQ(with({{"PG_TEST_TIMEOUT_DEFAULT", "42"}}).timeout_default(), std::chrono::seconds(42));
  EXPECT_EQ(with({{"PG_TEST_TIMEOUT_DEFAULT", " 7 "}}).timeout_default(), std::chrono::seconds(7));
}

TEST_F(EnvironmentConfigTest, InvalidTimeoutFallsBackAndWarns) {
  auto env = with({{"PG_TEST_TIMEOUT_DEFAULT", "abc"}});
  EXPECT_NO_THROW({ EXPECT_EQ(env.timeout_default(), std::chrono::seconds(180)); });

  auto stats = diagnostics::ErrorHandler::instance().get_error_stats();
  EXPECT_EQ(stats.errors_by_category[static_cast<size_t>(diagnostics::ErrorCategory::CONFIGURATION)], 1u);
  EXPECT_EQ(stats.errors_by_level[static_cast<size_t>(diagnostics::ErrorLevel::WARNING)], 1u);
}

TEST_F(EnvironmentConfigTest, NonPositiveTimeoutFallsBack) {
  EXPECT_EQ(with({{"PG_TEST_TIMEOUT_DEFAULT", "0"}}).timeout_default(), std::chrono::seconds(180));
  EXPECT_EQ(with({{"PG_TEST_TIMEOUT_DEFAULT", "-5"}}).timeout_default(), std::chrono::seconds(180));
}

TEST_F(EnvironmentConfigTest, ParseTimeoutRejectsGarbage) {
  EXPECT_EQ(EnvironmentConfig::parse_timeout_seconds("15"), 15);
  EXPECT_THROW(EnvironmentConfig::parse_timeout_seconds("1.5"), common::ConfigurationError);
  EXPECT_THROW(EnvironmentConfig::parse_timeout_seconds("10s"), common::ConfigurationError);
  EXPECT_THROW(EnvironmentConfig::parse_timeout_seconds("   "), common::ConfigurationError);
  EXPECT_THROW(EnvironmentConfig::parse_timeout_seconds("99999999999999999999"), common::ConfigurationError);

  try {
    EnvironmentConfig::parse_timeout_seconds("x");
    FAIL() << "expected ConfigurationError";
  } catch (const common::ConfigurationError& e) {
    EXPECT_EQ(e.get_variable(), "PG_TEST_TIMEOUT_DEFAULT");
    EXPECT_EQ(e.get_code(), ErrorCode::InvalidConfiguration);
  }
}

TEST_F(EnvironmentConfigTest, ValidateTimeout) {
  EXPECT_TRUE(EnvironmentConfig::validate_timeout("30").is_valid);
  auto result = EnvironmentConfig::validate_timeout("thirty");
  EXPECT_FALSE(result.is_valid);
  EXPECT_FALSE(result.error_message.empty());
}

// ============================================================================
// PG_TEST_EXTRA
// ============================================================================

TEST_F(EnvironmentConfigTest, ExtrasSplitOnWhitespace) {
  auto env = with({{"PG_TEST_EXTRA", " ssl\tkerberos  libpq_encryption\n"}});
  EXPECT_THAT(env.test_extras(), ElementsAre("ssl", "kerberos", "libpq_encryption"));
  EXPECT_TRUE(env.has_test_extra("ssl"));
  EXPECT_FALSE(env.has_test_extra("ss"));
}

TEST_F(EnvironmentConfigTest, RequireTestExtraNeedsEveryKey) {
  auto env = with({{"PG_TEST_EXTRA", "ssl kerberos"}});
  EXPECT_TRUE(env.require_test_extra({"ssl"}));
  EXPECT_TRUE(env.require_test_extra({"ssl", "kerberos"}));
  EXPECT_FALSE(env.require_test_extra({"ssl", "ldap"}));
}

TEST_F(EnvironmentConfigTest, NoExtrasWhenUnset) {
  auto env = with({});
  EXPECT_THAT(env.test_extras(), IsEmpty());
  EXPECT_FALSE(env.require_test_extra({"ssl"}));
}

// ============================================================================
// TLS material
// ============================================================================

TEST_F(EnvironmentConfigTest, TlsMaterialNeedsAllThreeFiles) {
  EXPECT_FALSE(with({{"PG_TEST_SSL_CERT", "server.crt"}, {"PG_TEST_SSL_KEY", "server.key"}}).tls_material());

  auto material = with({{"PG_TEST_SSL_CERT", "server.crt"},
                        {"PG_TEST_SSL_KEY", "server.key"},
                        {"PG_TEST_SSL_ROOT_CERT", "root.crt"}})
                      .tls_material();
  ASSERT_TRUE(material.has_value());
  EXPECT_EQ(material->cert_file, "server.crt");
  EXPECT_EQ(material->key_file, "server.key");
  EXPECT_EQ(material->root_cert_file, "root.crt");
  EXPECT_EQ(material->server_host, "localhost");
}

TEST_F(EnvironmentConfigTest, TlsServerHostOverride) {
  auto material = with({{"PG_TEST_SSL_CERT", "server.crt"},
                        {"PG_TEST_SSL_KEY", "server.key"},
                        {"PG_TEST_SSL_ROOT_CERT", "root.crt"},
                        {"PG_TEST_SSL_SERVER_HOST", "example.org"}})
                      .tls_material();
  ASSERT_TRUE(material.has_value());
  EXPECT_EQ(material->server_host, "example.org");
}

// ============================================================================
// ServerConfig
// ============================================================================

TEST(ServerConfigTest, UnixSocketPathFollowsPostgresNaming) {
  auto cfg = ServerConfig::unix_socket("/tmp/sock");
  EXPECT_EQ(cfg.unix_socket_path(), "/tmp/sock/.s.PGSQL.5432");
  EXPECT_EQ(cfg.backlog, 1);
  EXPECT_TRUE(cfg.is_valid());

  EXPECT_EQ(ServerConfig::unix_socket("/run/pg", 6543).unix_socket_path(), "/run/pg/.s.PGSQL.6543");
}

TEST(ServerConfigTest, TcpLoopbackUsesEphemeralPort) {
  auto cfg = ServerConfig::tcp_loopback();
  EXPECT_EQ(cfg.kind, config::EndpointKind::Tcp);
  EXPECT_EQ(cfg.bind_address, "127.0.0.1");
  EXPECT_EQ(cfg.port, 0);
  EXPECT_TRUE(cfg.is_valid());
}

TEST(ServerConfigTest, InvalidConfigurations) {
  EXPECT_FALSE(ServerConfig::unix_socket("").is_valid());

  auto cfg = ServerConfig::tcp_loopback();
  cfg.backlog = 0;
  EXPECT_FALSE(cfg.is_valid());
}
