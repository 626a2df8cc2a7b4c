// Copyright 2020 Google LLC
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

#ifndef GCP_AUTH_COMPLETION_QUEUE_H
#define GCP_AUTH_COMPLETION_QUEUE_H

#include "gcp_auth/future.h"
#include "gcp_auth/internal/completion_queue_impl.h"
#include "gcp_auth/status_or.h"
#include "gcp_auth/version.h"
#include <chrono>
#include <memory>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN

/**
 * Runs timers and background work for the library.
 *
 * Token refreshes, retry delays and blocking HTTP or subprocess calls are all
 * scheduled here. Nothing happens until at least one thread calls `Run()`,
 * usually through `BackgroundThreads`. Copies share the same event loop.
 */
class CompletionQueue {
 public:
  CompletionQueue();
  explicit CompletionQueue(std::shared_ptr<internal::CompletionQueueImpl> impl)
      : impl_(std::move(impl)) {}

  /// Services the queue until `Shutdown()`. Several threads may call this.
  void Run() { impl_->Run(); }

  void Shutdown() { impl_->Shutdown(); }

  /**
   * Returns a future satisfied with the expiration time once @p duration
   * elapses, or with `kCancelled` if the timer is cancelled or the queue shuts
   * down first.
   */
  template <typename Rep, typename Period>
  future<StatusOr<std::chrono::system_clock::time_point>> MakeRelativeTimer(
      std::chrono::duration<Rep, Period> duration) {
    return impl_->MakeRelativeTimer(
        std::chrono::duration_cast<std::chrono::nanoseconds>(duration));
  }

  /// Calls `functor()` from one of the threads in `Run()`.
  template <typename Functor>
  void RunAsync(Functor&& functor) {
    impl_->RunAsync(internal::MakeAsyncTask(std::forward<Functor>(functor)));
  }

 private:
  std::shared_ptr<internal::CompletionQueueImpl> impl_;
};

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_COMPLETION_QUEUE_H
