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

#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstddef>

namespace pqharness {
namespace transport {

namespace net = boost::asio;

/**
 * @brief Outcome of one asynchronous operation driven to completion
 */
struct OperationResult {
  boost::system::error_code ec = net::error::would_block;
  size_t transferred = 0;
  bool completed = false;
};

/**
 * @brief Run a single started operation on ioc for at most timeout
 *
 * The io_context must have no other outstanding work. On expiry cancel()
 * is invoked and the aborted handler is drained, so nothing references
 * the caller's buffers after this returns.
 *
 * @return true if the operation completed in time
 */
template <typename Cancel>
bool run_with_timeout(net::io_context& ioc, const OperationResult& result, std::chrono::steady_clock::duration timeout,
                      Cancel&& cancel) {
  ioc.restart();
  if (timeout > std::chrono::steady_clock::duration::zero()) {
    ioc.run_for(timeout);
  } else {
    ioc.poll();
  }
  if (result.completed) {
    return true;
  }

  cancel();
  ioc.restart();
  ioc.run();
  return false;
}

}  // namespace transport
}  // namespace pqharness
