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

#include <boost/asio/ssl/context.hpp>
#include <memory>

#include "pqharness/base/visibility.hpp"
#include "pqharness/config/environment_config.hpp"

namespace pqharness {
namespace transport {

/**
 * @brief Server TLS context loaded from PEM files
 *
 * TLS 1.2 or newer. The root certificate is only loaded as a verify path;
 * client certificates are not requested.
 *
 * @throws common::ServerError if a file cannot be loaded
 */
PQHARNESS_API std::shared_ptr<boost::asio::ssl::context> make_server_tls_context(const config::TlsMaterial& material);

}  // namespace transport
}  // namespace pqharness
