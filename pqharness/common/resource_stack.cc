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

#include "pqharness/common/resource_stack.hpp"

#include <exception>

#include "pqharness/common/exceptions.hpp"
#include "pqharness/diagnostics/error_handler.hpp"
#include "pqharness/diagnostics/logger.hpp"

namespace pqharness {
namespace common {

namespace {

std::string describe(const std::exception_ptr& error) {
  try {
    std::rethrow_exception(error);
  } catch (const HarnessException& e) {
    return e.get_full_message();
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "non-standard exception";
  }
}

}  // namespace

ResourceStack::ResourceStack(std::string name) : name_(std::move(name)) {}

ResourceStack::~ResourceStack() {
  try {
    release_all();
  } catch (const std::exception& e) {
    diagnostics::error_reporting::report_release_error(name_, "destroy",
                                                       std::string("release failed during destruction: ") + e.what());
  } catch (...) {
    diagnostics::error_reporting::report_release_error(name_, "destroy",
                                                       "release failed during destruction: non-standard exception");
  }
}

void ResourceStack::callback(ReleaseTask task) {
  if (!task) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (releasing_) {
    throw HarnessException("cannot register a resource while releasing", name_, "acquire", ErrorCode::InvalidState);
  }
  tasks_.push_back(std::move(task));
  released_ = false;
}

void ResourceStack::release_all() {
  std::vector<ReleaseTask> tasks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (releasing_) {
      return;
    }
    tasks.swap(tasks_);
    failures_.clear();
    releasing_ = true;
  }

  std::exception_ptr first_error;
  std::vector<std::string> failures;

  for (auto it = tasks.rbegin(); it != tasks.rend(); ++it) {
    try {
      (*it)();
    } catch (...) {
      auto error = std::current_exception();
      failures.push_back(describe(error));
      if (!first_error) {
        first_error = error;
      } else {
        // The first failure is the one the caller sees; keep the rest on record.
        diagnostics::error_reporting::report_release_error(name_, "release",
                                                           "secondary release failure: " + failures.back());
      }
    }
  }

  // Drop owned objects only after every action has run, newest first.
  while (!tasks.empty()) {
    tasks.pop_back();
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_ = failures;
    releasing_ = false;
    released_ = true;
  }

  if (first_error) {
    PQHARNESS_LOG_DEBUG(name_, "release", "rethrowing first release failure: " + failures.front());
    std::rethrow_exception(first_error);
  }
}

size_t ResourceStack::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size();
}

bool ResourceStack::released() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return released_;
}

std::vector<std::string> ResourceStack::release_failures() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failures_;
}

}  // namespace common
}  // namespace pqharness
