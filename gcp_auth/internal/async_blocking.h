// Copyright 2024 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef GCP_AUTH_INTERNAL_ASYNC_BLOCKING_H
#define GCP_AUTH_INTERNAL_ASYNC_BLOCKING_H

#include "gcp_auth/completion_queue.h"
#include "gcp_auth/future.h"
#include "gcp_auth/internal/make_status.h"
#include "gcp_auth/status_or.h"
#include "gcp_auth/version.h"
#include "absl/types/optional.h"
#include <functional>
#include <utility>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

/**
 * Wraps a blocking function and the promise receiving its result.
 *
 * If the task is destroyed without running, e.g. because the completion queue
 * is shut down, the promise is satisfied with a `kCancelled` error.
 */
template <typename T>
class BlockingTask {
 public:
  BlockingTask(promise<StatusOr<T>> p, std::function<StatusOr<T>()> function)
      : promise_(std::move(p)), function_(std::move(function)) {}
  BlockingTask(BlockingTask&& rhs) noexcept
      : promise_(std::move(rhs.promise_)),
        function_(std::move(rhs.function_)) {
    rhs.promise_.reset();
  }
  BlockingTask(BlockingTask const&) = delete;
  BlockingTask& operator=(BlockingTask const&) = delete;
  BlockingTask& operator=(BlockingTask&&) = delete;

  ~BlockingTask() {
    if (!promise_) return;
    promise_->set_value(
        CancelledError("the completion queue was shut down before running "
                       "the operation",
                       GCP_AUTH_ERROR_INFO()));
  }

  void operator()() {
    auto p = *std::move(promise_);
    promise_.reset();
    p.set_value(function_());
  }

 private:
  absl::optional<promise<StatusOr<T>>> promise_;
  std::function<StatusOr<T>()> function_;
};

/**
 * Runs @p function in one of the threads servicing @p cq.
 *
 * This is used to run blocking operations, such as HTTP requests with
 * libcurl or subprocesses, without blocking the calling thread.
 */
template <typename T>
future<StatusOr<T>> AsyncRunBlocking(CompletionQueue& cq,
                                     std::function<StatusOr<T>()> function) {
  promise<StatusOr<T>> p;
  auto f = p.get_future();
  cq.RunAsync(BlockingTask<T>(std::move(p), std::move(function)));
  return f;
}

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_ASYNC_BLOCKING_H
