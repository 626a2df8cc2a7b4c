// Copyright 2018 Google LLC
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

#ifndef GCP_AUTH_INTERNAL_COMPLETION_QUEUE_IMPL_H
#define GCP_AUTH_INTERNAL_COMPLETION_QUEUE_IMPL_H

#include "gcp_auth/future.h"
#include "gcp_auth/status_or.h"
#include "gcp_auth/version.h"
#include "absl/memory/memory.h"
#include <chrono>
#include <memory>
#include <type_traits>
#include <utility>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

/// A move-only function scheduled with `CompletionQueue::RunAsync()`.
class AsyncTask {
 public:
  virtual ~AsyncTask() = default;
  virtual void Run() = 0;
};

template <typename F>
class AsyncTaskImpl final : public AsyncTask {
 public:
  explicit AsyncTaskImpl(F f) : f_(std::move(f)) {}
  void Run() override { f_(); }

 private:
  F f_;
};

template <typename F>
std::unique_ptr<AsyncTask> MakeAsyncTask(F&& f) {
  using Impl = AsyncTaskImpl<typename std::decay<F>::type>;
  return absl::make_unique<Impl>(std::forward<F>(f));
}

/**
 * The event loop behind a `CompletionQueue`.
 *
 * A task that never runs, because the loop was shut down, is destroyed
 * without calling `Run()`. Timers created after `Shutdown()` complete
 * immediately with `kCancelled`.
 */
class CompletionQueueImpl {
 public:
  virtual ~CompletionQueueImpl() = default;

  virtual void Run() = 0;
  virtual void Shutdown() = 0;

  virtual future<StatusOr<std::chrono::system_clock::time_point>>
  MakeRelativeTimer(std::chrono::nanoseconds duration) = 0;

  virtual void RunAsync(std::unique_ptr<AsyncTask> task) = 0;
};

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_COMPLETION_QUEUE_IMPL_H
