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

#include "pqharness/base/error_codes.hpp"
#include "pqharness/base/visibility.hpp"

// Error handling and logging
#include "pqharness/common/exceptions.hpp"
#include "pqharness/diagnostics/error_handler.hpp"
#include "pqharness/diagnostics/logger.hpp"

// Configuration and scoping
#include "pqharness/common/resource_stack.hpp"
#include "pqharness/config/environment_config.hpp"
#include "pqharness/config/server_config.hpp"
#include "pqharness/timing/timeout_budget.hpp"

// Wire protocol and mock server
#include "pqharness/framer/protocol_framer.hpp"
#include "pqharness/framer/wire_message.hpp"
#include "pqharness/server/background_server.hpp"
#include "pqharness/transport/peer_connection.hpp"
#include "pqharness/transport/tls_context.hpp"

// Native client wrapper
#include "pqharness/client/connection_options.hpp"
#include "pqharness/client/libpq_api.hpp"
#include "pqharness/client/libpq_client.hpp"

namespace pqharness {

// === Public API Namespaces ===
using client::ConnectionOptions;
using client::Libpq;
using server::BackgroundServer;
using timing::TimeoutBudget;

}  // namespace pqharness
