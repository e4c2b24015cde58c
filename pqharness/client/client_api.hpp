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

#include <libpq-fe.h>

#include <optional>
#include <string>

#include "pqharness/base/visibility.hpp"

namespace pqharness {
namespace client {

/**
 * @brief The native client calls the harness depends on
 *
 * One virtual per libpq entry point, so tests can substitute a mock for
 * the real library.
 */
class PQHARNESS_API ClientApi {
 public:
  virtual ~ClientApi() = default;

  virtual PGconn* connectdb(const std::string& conninfo) = 0;
  virtual ConnStatusType status(const PGconn* conn) = 0;
  virtual std::string error_message(const PGconn* conn) = 0;
  virtual void finish(PGconn* conn) = 0;

  virtual PGresult* exec(PGconn* conn, const std::string& query) = 0;
  virtual ExecStatusType result_status(const PGresult* result) = 0;
  virtual std::string result_error_message(const PGresult* result) = 0;
  virtual void clear(PGresult* result) = 0;

  /**
   * @brief Name of the TLS library the client was built with, if any
   */
  virtual std::optional<std::string> ssl_library() = 0;
};

}  // namespace client
}  // namespace pqharness
