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

#include <chrono>
#include <functional>

#include "pqharness/base/visibility.hpp"
#include "pqharness/config/environment_config.hpp"

namespace pqharness {
namespace timing {

/**
 * @brief Per-test time budget against a fixed deadline
 *
 * The deadline is computed once at construction. remaining() never goes
 * below zero and never increases, so every blocking call in the harness
 * can use it as its default timeout.
 */
class PQHARNESS_API TimeoutBudget {
 public:
  using Clock = std::chrono::steady_clock;
  using Seconds = std::chrono::duration<double>;
  using NowFunction = std::function<Clock::time_point()>;

  /**
   * @brief Budget of PG_TEST_TIMEOUT_DEFAULT seconds from now
   */
  TimeoutBudget();
  explicit TimeoutBudget(const config::EnvironmentConfig& env);
  explicit TimeoutBudget(Clock::duration total, NowFunction now = &Clock::now);

  Seconds remaining() const;

  /**
   * @brief remaining() truncated to whole seconds, at least 1
   */
  int remaining_whole_seconds() const;

  bool expired() const;

  Clock::time_point deadline() const { return deadline_; }
  Clock::duration total() const { return total_; }

 private:
  NowFunction now_;
  Clock::duration total_;
  Clock::time_point deadline_;
};

}  // namespace timing
}  // namespace pqharness
