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
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "pqharness/base/visibility.hpp"
#include "pqharness/common/resource_stack.hpp"
#include "pqharness/config/server_config.hpp"
#include "pqharness/timing/timeout_budget.hpp"
#include "pqharness/transport/peer_connection.hpp"

namespace pqharness {
namespace server {

/**
 * @brief Single-connection mock server driven by a scripted handler
 *
 * Typical use:
 * @code
 *   BackgroundServer server(config::ServerConfig::unix_socket(dir), budget);
 *   server.bind_and_listen();
 *   server.run_in_background([](transport::PeerConnection& peer) {
 *     peer.expect_startup();
 *     peer.send(framer::AuthenticationOk{});
 *     ...
 *   });
 *   // drive the client against server.conninfo()
 *   server.join_and_propagate();
 * @endcode
 *
 * The handler runs on a worker thread and owns the accepted connection.
 * Anything it throws is re-raised on the test thread by
 * join_and_propagate() or close(). Tests must call one of them: the
 * destructor never throws, so a failure still pending there is only
 * recorded with ErrorHandler and the test would pass. Teardown happens in
 * reverse order of setup: join the worker, remove the socket file, close
 * the listener.
 */
class PQHARNESS_API BackgroundServer {
 public:
  enum class State { Idle, Listening, Accepted, Completed, Failed, Joined };

  using Handler = std::function<void(transport::PeerConnection&)>;
  using ConnInfo = std::vector<std::pair<std::string, std::string>>;

  BackgroundServer(config::ServerConfig cfg, timing::TimeoutBudget budget);

  /**
   * Releases everything still held; failures are reported, never thrown.
   * Call close() first to have a handler failure raised.
   */
  ~BackgroundServer();

  BackgroundServer(const BackgroundServer&) = delete;
  BackgroundServer& operator=(const BackgroundServer&) = delete;

  /**
   * @brief Create, bind and listen on the configured endpoint
   * @throws common::ServerError if the server is not Idle or the bind fails
   */
  void bind_and_listen();

  /**
   * @brief Accept one client on a worker thread and run handler on it
   *
   * Accept and every socket operation are bounded by the remaining budget.
   */
  void run_in_background(Handler handler);

  /**
   * @brief As run_in_background(), after answering an SSLRequest with 'S'
   *        and completing a TLS handshake
   */
  void run_in_background_tls(std::shared_ptr<boost::asio::ssl::context> tls, Handler handler);

  /**
   * @brief Wait for the worker and rethrow whatever the handler threw
   *
   * Waits at most remaining() + 1s. No-op once joined or if nothing was
   * started.
   *
   * @throws common::TimeoutError if the worker is still running; the
   *         thread is then detached and reported as leaked
   */
  void join_and_propagate();

  /**
   * @brief Release everything now
   * @throws the first release failure
   */
  void close();

  State state() const;

  /**
   * @brief Block until the worker reports state or timeout passes
   * @return true if the state was reached
   */
  bool wait_for_state(State state, std::chrono::steady_clock::duration timeout) const;

  /**
   * @brief Socket directory for UNIX endpoints, bind address for TCP
   */
  std::string host() const;
  uint16_t port() const;

  /**
   * @brief Connection parameters pointing a client at this server
   */
  ConnInfo conninfo() const;

  const config::ServerConfig& config() const { return cfg_; }

 private:
  struct Session;

  void start(std::shared_ptr<boost::asio::ssl::context> tls, Handler handler);

  config::ServerConfig cfg_;
  timing::TimeoutBudget budget_;
  std::shared_ptr<Session> session_;
  std::thread worker_;
  std::future<void> result_;
  uint16_t bound_port_{0};
  bool abandoned_{false};

  // Declared last: released before the members its callbacks use.
  common::ResourceStack stack_;
};

PQHARNESS_API std::string to_string(BackgroundServer::State state);

}  // namespace server
}  // namespace pqharness
