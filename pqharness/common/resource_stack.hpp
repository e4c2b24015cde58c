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

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "pqharness/base/visibility.hpp"

namespace pqharness {
namespace common {

/**
 * RAII stack of release actions
 *
 * Actions run in strict LIFO order, each exactly once, whichever way the
 * owning scope is left. A failing action does not stop the others; the
 * first failure is rethrown from release_all() after every action has run
 * and later failures are reported to the ErrorHandler.
 *
 * Registering a new action from inside a running release action is not
 * supported and is rejected.
 */
class PQHARNESS_API ResourceStack {
 public:
  using ReleaseTask = std::function<void()>;

  explicit ResourceStack(std::string name = "resource_stack");

  /**
   * Runs release_all(); failures are reported, never thrown
   */
  ~ResourceStack();

  ResourceStack(const ResourceStack&) = delete;
  ResourceStack& operator=(const ResourceStack&) = delete;
  ResourceStack(ResourceStack&&) = delete;
  ResourceStack& operator=(ResourceStack&&) = delete;

  /**
   * Register a bare release action
   */
  void callback(ReleaseTask task);

  /**
   * Register release(resource) and hand the resource back to the caller
   */
  template <typename Resource, typename Release>
  Resource acquire(Resource resource, Release release) {
    callback([resource, release = std::move(release)]() mutable { release(resource); });
    return resource;
  }

  /**
   * Take ownership of an object with a close() member. The object is
   * closed during release and destroyed once every action has run.
   */
  template <typename T>
  T& enter(std::unique_ptr<T> object) {
    std::shared_ptr<T> owned(std::move(object));
    T& ref = *owned;
    callback([owned]() { owned->close(); });
    return ref;
  }

  /**
   * Run every registered action in reverse order of registration
   * @throws the first exception raised by an action, after all have run
   */
  void release_all();

  size_t size() const;
  bool released() const;

  /**
   * Messages of every failure seen by the last release_all()
   */
  std::vector<std::string> release_failures() const;

 private:
  std::string name_;
  mutable std::mutex mutex_;
  std::vector<ReleaseTask> tasks_;
  std::vector<std::string> failures_;
  bool releasing_{false};
  bool released_{false};
};

}  // namespace common
}  // namespace pqharness
