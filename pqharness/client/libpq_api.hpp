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

#include "pqharness/client/client_api.hpp"

namespace pqharness {
namespace client {

/**
 * @brief ClientApi backed by the linked libpq
 */
class PQHARNESS_API LibpqApi : public ClientApi {
 public:
  static LibpqApi& instance();

  PGconn* connectdb(const std::string& conninfo) override;
  ConnStatusType status(const PGconn* conn) override;
  std::string error_message(const PGconn* conn) override;
  void finish(PGconn* conn) override;

  PGresult* exec(PGconn* conn, const std::string& query) override;
  ExecStatusType result_status(const PGresult* result) override;
  std::string result_error_message(const PGresult* result) override;
  void clear(PGresult* result) override;

  std::optional<std::string> ssl_library() override;
};

}  // namespace client
}  // namespace pqharness
