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

#include "pqharness/client/libpq_client.hpp"

#include <memory>
#include <utility>

#include "pqharness/client/libpq_api.hpp"
#include "pqharness/common/exceptions.hpp"
#include "pqharness/diagnostics/error_handler.hpp"
#include "pqharness/diagnostics/logger.hpp"

namespace pqharness {
namespace client {

using common::ConnectionError;
using common::QueryError;

namespace {

constexpr const char* kComponent = "client";
constexpr const char* kConnectTimeout = "connect_timeout";

}  // namespace

ExecStatusType Result::status() const { return api_.result_status(result_); }

std::string Result::error_message() const { return api_.result_error_message(result_); }

void Result::clear() {
  if (result_ == nullptr) {
    return;
  }
  PGresult* result = result_;
  result_ = nullptr;
  api_.clear(result);
}

Result& Connection::exec(const std::string& query) {
  PGresult* raw = api_.exec(conn_, query);
  if (raw == nullptr) {
    std::string message = "no result: " + api_.error_message(conn_);
    diagnostics::error_reporting::report_query_error(kComponent, "exec", message);
    throw QueryError(message, query);
  }

  Result& result = stack_.enter(std::make_unique<Result>(api_, raw));

  ExecStatusType status = result.status();
  if (status == PGRES_BAD_RESPONSE || status == PGRES_FATAL_ERROR) {
    std::string message = result.error_message();
    if (message.empty()) {
      message = PQresStatus(status);
    }
    result.clear();
    diagnostics::error_reporting::report_query_error(kComponent, "exec", message);
    throw QueryError(message, query, static_cast<int>(status));
  }

  PQHARNESS_LOG_DEBUG(kComponent, "exec", "query finished with " + std::string(PQresStatus(status)));
  return result;
}

ConnStatusType Connection::status() const { return api_.status(conn_); }

std::string Connection::error_message() const { return api_.error_message(conn_); }

void Connection::finish() {
  if (conn_ == nullptr) {
    return;
  }
  PGconn* conn = conn_;
  conn_ = nullptr;
  api_.finish(conn);
}

Libpq::Libpq(ClientApi& api, timing::TimeoutBudget budget) : api_(api), budget_(std::move(budget)), stack_("libpq") {}

Libpq::Libpq(timing::TimeoutBudget budget) : Libpq(LibpqApi::instance(), std::move(budget)) {}

Connection& Libpq::must_connect(ConnectionOptions options) {
  if (!options.has(kConnectTimeout)) {
    options.set(kConnectTimeout, budget_.remaining_whole_seconds());
  }

  std::string conninfo = build_connection_string(options);
  PGconn* raw = api_.connectdb(conninfo);
  if (raw == nullptr) {
    throw ConnectionError("out of memory allocating a connection", conninfo);
  }

  Connection& conn = stack_.enter(std::make_unique<Connection>(api_, raw, stack_));

  if (conn.status() != kConnectionOk) {
    std::string message = conn.error_message();
    diagnostics::error_reporting::report_connection_error(kComponent, "connect", message);
    throw ConnectionError(message, conninfo);
  }

  PQHARNESS_LOG_DEBUG(kComponent, "connect", "connected with " + conninfo);
  return conn;
}

bool Libpq::ssl_supported() const { return api_.ssl_library().has_value(); }

void Libpq::close() { stack_.release_all(); }

}  // namespace client
}  // namespace pqharness
