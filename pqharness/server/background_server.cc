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

#include "pqharness/server/background_server.hpp"

#include <boost/asio/io_context.hpp>
#include <chrono>
#include <filesystem>
#include <system_error>

#include "pqharness/common/exceptions.hpp"
#include "pqharness/common/thread_safe_state.hpp"
#include "pqharness/diagnostics/error_handler.hpp"
#include "pqharness/diagnostics/logger.hpp"
#include "pqharness/framer/wire_message.hpp"
#include "pqharness/transport/listener.hpp"

namespace pqharness {
namespace server {

using common::ServerError;
using common::TimeoutError;

namespace {

constexpr const char* kComponent = "background_server";

transport::PeerConnection::Duration to_duration(timing::TimeoutBudget::Seconds seconds) {
  return std::chrono::duration_cast<transport::PeerConnection::Duration>(seconds);
}

/**
 * Record a worker failure with ErrorHandler by category and describe it.
 * Scripted assertions are not recorded; join_and_propagate() hands them
 * to the test.
 */
std::string record_failure(const std::exception_ptr& error) {
  using namespace diagnostics::error_reporting;
  try {
    std::rethrow_exception(error);
  } catch (const common::TimeoutError& e) {
    report_timeout(e.get_component(), e.get_operation(), e.what());
    return e.get_full_message();
  } catch (const common::FramingError& e) {
    report_framing_error(kComponent, e.get_operation(), e.what());
    return e.get_full_message();
  } catch (const ServerError& e) {
    report_system_error(kComponent, e.get_operation(), e.what());
    return e.get_full_message();
  } catch (const common::HarnessException& e) {
    return e.get_full_message();
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "unknown exception";
  }
}

}  // namespace

/**
 * State shared with the worker. A detached worker keeps it alive, so the
 * io_context and listener outlive the BackgroundServer in that case.
 */
struct BackgroundServer::Session {
  std::shared_ptr<boost::asio::io_context> ioc = std::make_shared<boost::asio::io_context>();
  std::unique_ptr<transport::Listener> listener;
  common::ThreadSafeState<State> state{State::Idle};
};

BackgroundServer::BackgroundServer(config::ServerConfig cfg, timing::TimeoutBudget budget)
    : cfg_(std::move(cfg)), budget_(std::move(budget)), session_(std::make_shared<Session>()), stack_(kComponent) {}

BackgroundServer::~BackgroundServer() = default;

void BackgroundServer::bind_and_listen() {
  if (!session_->state.is_state(State::Idle)) {
    throw ServerError("server is " + to_string(state()) + ", expected Idle", "bind", ErrorCode::InvalidState);
  }

  session_->listener = transport::make_listener(cfg_, session_->ioc);

  boost::system::error_code ec;
  session_->listener->open_and_bind(ec);
  if (ec) {
    boost::system::error_code ignored;
    session_->listener->close(ignored);
    std::string message = "could not bind " + host() + " port " + std::to_string(cfg_.port) + ": " + ec.message();
    diagnostics::error_reporting::report_system_error(kComponent, "bind", message, ec);
    throw ServerError(message, "bind", ErrorCode::BindFailed);
  }

  std::shared_ptr<Session> session = session_;
  stack_.callback([this, session]() {
    if (abandoned_) {
      // The detached worker may still be using the listener; it goes when the session does.
      PQHARNESS_LOG_WARNING(kComponent, "close", "listener left to the abandoned worker");
      return;
    }
    boost::system::error_code close_ec;
    session->listener->close(close_ec);
    if (close_ec) {
      throw ServerError("could not close listener: " + close_ec.message(), "close");
    }
  });

  if (cfg_.kind == config::EndpointKind::Unix) {
    std::string path = cfg_.unix_socket_path();
    stack_.callback([path]() {
      std::error_code remove_ec;
      std::filesystem::remove(path, remove_ec);
      if (remove_ec) {
        throw ServerError("could not remove " + path + ": " + remove_ec.message(), "unlink");
      }
    });
  }

  session_->listener->listen(cfg_.backlog, ec);
  if (ec) {
    throw ServerError("could not listen: " + ec.message(), "listen", ErrorCode::BindFailed);
  }

  // Read once here; the acceptor belongs to the worker once accept starts.
  bound_port_ = session_->listener->local_port();

  session_->state.set_state(State::Listening);
  PQHARNESS_LOG_INFO(kComponent, "bind",
                     "listening on " + host() + " port " + std::to_string(port()) + " with backlog " +
                         std::to_string(cfg_.backlog));
}

void BackgroundServer::run_in_background(Handler handler) { start(nullptr, std::move(handler)); }

void BackgroundServer::run_in_background_tls(std::shared_ptr<boost::asio::ssl::context> tls, Handler handler) {
  if (!tls) {
    throw ServerError("no TLS context given", "run", ErrorCode::InvalidConfiguration);
  }
  start(std::move(tls), std::move(handler));
}

void BackgroundServer::start(std::shared_ptr<boost::asio::ssl::context> tls, Handler handler) {
  if (!session_->state.is_state(State::Listening) || worker_.joinable() || !session_->listener->is_open()) {
    throw ServerError("server is " + to_string(state()) + ", expected Listening", "run", ErrorCode::InvalidState);
  }
  if (!handler) {
    throw ServerError("no handler given", "run", ErrorCode::InvalidConfiguration);
  }

  std::promise<void> done;
  result_ = done.get_future();

  stack_.callback([this]() { join_and_propagate(); });

  std::shared_ptr<Session> session = session_;
  timing::TimeoutBudget budget = budget_;
  worker_ = std::thread([session, budget, tls = std::move(tls), handler = std::move(handler),
                         done = std::move(done)]() mutable {
    try {
      auto peer = session->listener->accept(to_duration(budget.remaining()));
      session->state.set_state(State::Accepted);
      PQHARNESS_LOG_DEBUG(kComponent, "accept", "client connected");

      peer->set_timeout(to_duration(budget.remaining()));
      if (tls) {
        peer->expect_ssl_request();
        peer->send(framer::SslResponse{true});
        peer = peer->upgrade_to_tls(*tls);
      }

      handler(*peer);
      peer->close();

      session->state.set_state(State::Completed);
      done.set_value();
    } catch (...) {
      auto error = std::current_exception();
      PQHARNESS_LOG_DEBUG(kComponent, "run", "handler failed: " + record_failure(error));
      session->state.set_state(State::Failed);
      done.set_exception(error);
    }
  });
}

void BackgroundServer::join_and_propagate() {
  if (!worker_.joinable() || abandoned_) {
    return;
  }

  auto wait = to_duration(budget_.remaining()) + std::chrono::seconds(1);
  if (result_.wait_for(wait) != std::future_status::ready) {
    abandoned_ = true;
    worker_.detach();
    diagnostics::error_reporting::report_leak(kComponent, "join",
                                              "background thread abandoned while in state " + to_string(state()));
    throw TimeoutError("background thread is still running after timeout", kComponent, "join");
  }

  worker_.join();
  session_->state.set_state(State::Joined);
  result_.get();
}

void BackgroundServer::close() { stack_.release_all(); }

BackgroundServer::State BackgroundServer::state() const { return session_->state.get_state(); }

bool BackgroundServer::wait_for_state(State state, std::chrono::steady_clock::duration timeout) const {
  return session_->state.wait_for_state(state, timeout);
}

std::string BackgroundServer::host() const {
  return cfg_.kind == config::EndpointKind::Unix ? cfg_.socket_dir : cfg_.bind_address;
}

uint16_t BackgroundServer::port() const { return bound_port_ != 0 ? bound_port_ : cfg_.port; }

BackgroundServer::ConnInfo BackgroundServer::conninfo() const {
  const char* host_key = cfg_.kind == config::EndpointKind::Unix ? "host" : "hostaddr";
  return {{host_key, host()}, {"port", std::to_string(port())}};
}

std::string to_string(BackgroundServer::State state) {
  switch (state) {
    case BackgroundServer::State::Idle:
      return "Idle";
    case BackgroundServer::State::Listening:
      return "Listening";
    case BackgroundServer::State::Accepted:
      return "Accepted";
    case BackgroundServer::State::Completed:
      return "Completed";
    case BackgroundServer::State::Failed:
      return "Failed";
    case BackgroundServer::State::Joined:
      return "Joined";
  }
  return "Unknown";
}

}  // namespace server
}  // namespace pqharness
