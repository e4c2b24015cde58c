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

#include "pqharness/timing/timeout_budget.hpp"

#include <algorithm>

namespace pqharness {
namespace timing {

TimeoutBudget::TimeoutBudget() : TimeoutBudget(config::EnvironmentConfig{}) {}

TimeoutBudget::TimeoutBudget(const config::EnvironmentConfig& env) : TimeoutBudget(env.timeout_default()) {}

TimeoutBudget::TimeoutBudget(Clock::duration total, NowFunction now)
    : now_(std::move(now)), total_(total), deadline_(now_() + total) {}

TimeoutBudget::Seconds TimeoutBudget::remaining() const {
  auto left = std::chrono::duration_cast<Seconds>(deadline_ - now_());
  return std::max(left, Seconds::zero());
}

int TimeoutBudget::remaining_whole_seconds() const { return std::max(static_cast<int>(remaining().count()), 1); }

bool TimeoutBudget::expired() const { return remaining() == Seconds::zero(); }

}  // namespace timing
}  // namespace pqharness
