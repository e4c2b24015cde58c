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

#include <string>

#include "pqharness/base/visibility.hpp"
#include "pqharness/client/client_api.hpp"
#include "pqharness/client/connection_options.hpp"
#include "pqharness/common/resource_stack.hpp"
#include "pqharness/timing/timeout_budget.hpp"

namespace pqharness {
namespace client {

constexpr ConnStatusType kConnectionOk = CONNECTION_OK;
constexpr ExecStatusType kEmptyQuery = PGRES_EMPTY_QUERY;

/**
 * @brief A PGresult owned by the session's resource stack
 */
class PQHARNESS_API Result {
 public:
  Result(ClientApi& api, PGresult* result) : api_(api), result_(result) {}
  ~Result() = default;

  Result(const Result&) = delete;
  Result& operator=(const Result&) = delete;

  ExecStatusType status() const;
  std::string error_message() const;

  /**
   * @brief Release the result now; later calls do nothing
   */
  void clear();
  void close() { clear(); }

  bool cleared() const { return result_ == nullptr; }
  PGresult* get() const { return result_; }

 private:
  ClientApi& api_;
  PGresult* result_;
};

/**
 * @brief A PGconn owned by the session's resource stack
 *
 * Results of exec() go on the same stack and are released before the
 * connection.
 */
class PQHARNESS_API Connection {
 public:
  Connection(ClientApi& api, PGconn* conn, common::ResourceStack& stack) : api_(api), conn_(conn), stack_(stack) {}
  ~Connection() = default;

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  /**
   * @brief Run one simple query
   * @throws common::QueryError if no result comes back or the result is
   *         PGRES_BAD_RESPONSE or PGRES_FATAL_ERROR
   */
  Result& exec(const std::string& query);

  ConnStatusType status() const;
  std::string error_message() const;

  /**
   * @brief Close the connection now; later calls do nothing
   */
  void finish();
  void close() { finish(); }

  bool finished() const { return conn_ == nullptr; }
  PGconn* get() const { return conn_; }

 private:
  ClientApi& api_;
  PGconn* conn_;
  common::ResourceStack& stack_;
};

/**
 * @brief Client session for one test
 *
 * Every connection and result it hands out is released, newest first,
 * when the session is closed or destroyed. References returned by
 * must_connect() and exec() are valid until then.
 */
class PQHARNESS_API Libpq {
 public:
  Libpq(ClientApi& api, timing::TimeoutBudget budget);
  explicit Libpq(timing::TimeoutBudget budget);
  ~Libpq() = default;

  Libpq(const Libpq&) = delete;
  Libpq& operator=(const Libpq&) = delete;

  /**
   * @brief Connect with the given options
   *
   * connect_timeout defaults to the remaining budget in whole seconds
   * (at least 1). The handle is owned by the session even when the
   * connection fails.
   *
   * @throws common::ConnectionError carrying libpq's error message
   */
  Connection& must_connect(ConnectionOptions options);

  /**
   * @brief True if the client library was built with TLS support
   */
  bool ssl_supported() const;

  /**
   * @brief Release every connection and result now
   * @throws the first release failure
   */
  void close();

  ClientApi& api() const { return api_; }
  const timing::TimeoutBudget& budget() const { return budget_; }

 private:
  ClientApi& api_;
  timing::TimeoutBudget budget_;
  common::ResourceStack stack_;
};

}  // namespace client
}  // namespace pqharness
