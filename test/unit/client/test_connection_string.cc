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

#include <gtest/gtest.h>

#include <string>

#include "pqharness/client/connection_options.hpp"

using namespace pqharness;
using client::build_connection_string;
using client::ConnectionOptions;

struct ConnStrCase {
  ConnectionOptions options;
  std::string expected;
};

class ConnectionStringTest : public ::testing::TestWithParam<ConnStrCase> {};

TEST_P(ConnectionStringTest, EscapesValues) {
  const auto& param = GetParam();
  EXPECT_EQ(build_connection_string(param.options), param.expected);
}

INSTANTIATE_TEST_SUITE_P(
    Escaping, ConnectionStringTest,
    ::testing::Values(ConnStrCase{ConnectionOptions{}, ""},
                      ConnStrCase{ConnectionOptions().set("port", 5432), "port=5432"},
                      ConnStrCase{ConnectionOptions().set("port", 5432).set("dbname", "postgres"),
                                  "port=5432 dbname=postgres"},
                      ConnStrCase{ConnectionOptions{{"host", ""}}, "host=''"},
                      ConnStrCase{ConnectionOptions{{"host", " "}}, "host=' '"},
                      ConnStrCase{ConnectionOptions{{"keyword", "'"}}, R"(keyword=\')"},
                      ConnStrCase{ConnectionOptions{{"keyword", R"( \' )"}}, R"(keyword=' \\\' ')"},
                      ConnStrCase{ConnectionOptions{{"keyword", "a\tb"}}, "keyword='a\tb'"}));

TEST(ConnectionOptionsTest, SetReplacesInPlace) {
  ConnectionOptions options;
  options.set("host", "/tmp").set("port", 5432).set("host", "/run");

  ASSERT_EQ(options.size(), 2u);
  EXPECT_EQ(options.entries()[0].first, "host");
  EXPECT_EQ(options.entries()[0].second, "/run");
  EXPECT_EQ(build_connection_string(options), "host=/run port=5432");
}

TEST(ConnectionOptionsTest, LookupAndMerge) {
  ConnectionOptions base{{"host", "/tmp"}, {"port", "5432"}};
  EXPECT_TRUE(base.has("port"));
  EXPECT_FALSE(base.has("sslmode"));
  EXPECT_EQ(base.get("host").value_or(""), "/tmp");

  base.merge(ConnectionOptions{{"sslmode", "require"}, {"port", "6543"}});
  EXPECT_EQ(build_connection_string(base), "host=/tmp port=6543 sslmode=require");
}

TEST(ConnectionOptionsTest, FromServerConnInfo) {
  std::vector<ConnectionOptions::Entry> info{{"hostaddr", "127.0.0.1"}, {"port", "40123"}};
  EXPECT_EQ(build_connection_string(ConnectionOptions(info)), "hostaddr=127.0.0.1 port=40123");
}
