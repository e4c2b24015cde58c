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

#include "pqharness/client/libpq_api.hpp"

namespace pqharness {
namespace client {

namespace {

std::string to_string_or_empty(const char* text) { return text ? std::string(text) : std::string(); }

}  // namespace

LibpqApi& LibpqApi::instance() {
  static LibpqApi api;
  return api;
}

PGconn* LibpqApi::connectdb(const std::string& conninfo) { return PQconnectdb(conninfo.c_str()); }

ConnStatusType LibpqApi::status(const PGconn* conn) { return PQstatus(conn); }

std::string LibpqApi::error_message(const PGconn* conn) { return to_string_or_empty(PQerrorMessage(conn)); }

void LibpqApi::finish(PGconn* conn) { PQfinish(conn); }

PGresult* LibpqApi::exec(PGconn* conn, const std::string& query) { return PQexec(conn, query.c_str()); }

ExecStatusType LibpqApi::result_status(const PGresult* result) { return PQresultStatus(result); }

std::string LibpqApi::result_error_message(const PGresult* result) {
  return to_string_or_empty(PQresultErrorMessage(result));
}

void LibpqApi::clear(PGresult* result) { PQclear(result); }

std::optional<std::string> LibpqApi::ssl_library() {
  const char* library = PQsslAttribute(nullptr, "library");
  if (library == nullptr) {
    return std::nullopt;
  }
  return std::string(library);
}

}  // namespace client
}  // namespace pqharness
