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
#include <condition_variable>
#include <mutex>

namespace pqharness {
namespace common {

/**
 * @brief Thread-safe state holder
 *
 * Written by the background worker, observed by the test thread.
 */
template <typename StateType>
class ThreadSafeState {
 public:
  using State = StateType;

  explicit ThreadSafeState(const State& initial_state = State{}) : state_(initial_state) {}
  ThreadSafeState(const ThreadSafeState&) = delete;
  ThreadSafeState& operator=(const ThreadSafeState&) = delete;

  State get_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
  }

  void set_state(const State& new_state) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      state_ = new_state;
    }
    cv_.notify_all();
  }

  bool is_state(const State& expected_state) const { return get_state() == expected_state; }

  /**
   * @brief Block until the state equals expected_state or the timeout passes
   * @return true if the state was reached
   */
  template <typename Rep, typename Period>
  bool wait_for_state(const State& expected_state, std::chrono::duration<Rep, Period> timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return state_ == expected_state; });
  }

 private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  State state_;
};

}  // namespace common
}  // namespace pqharness
