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

#ifndef GCP_AUTH_INTERNAL_DEFAULT_COMPLETION_QUEUE_IMPL_H
#define GCP_AUTH_INTERNAL_DEFAULT_COMPLETION_QUEUE_IMPL_H

#include "gcp_auth/internal/completion_queue_impl.h"
#include "gcp_auth/version.h"
#include <grpcpp/grpcpp.h>
#include <memory>
#include <mutex>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

/**
 * A `CompletionQueueImpl` backed by a `grpc::CompletionQueue`.
 *
 * Timers and tasks are `grpc::Alarm`s. The tag of each alarm is a heap
 * allocated handle owning the operation, released by `Run()` when gRPC
 * reports the alarm.
 */
class DefaultCompletionQueueImpl : public CompletionQueueImpl {
 public:
  class Operation {
   public:
    virtual ~Operation() = default;
    virtual void Arm(grpc::CompletionQueue& cq, void* tag) = 0;
    /// @p ok is false if the alarm was cancelled or the queue shut down.
    virtual void Complete(bool ok) = 0;
  };

  void Run() override;
  void Shutdown() override;

  future<StatusOr<std::chrono::system_clock::time_point>> MakeRelativeTimer(
      std::chrono::nanoseconds duration) override;

  void RunAsync(std::unique_ptr<AsyncTask> task) override;

 private:
  void Start(std::shared_ptr<Operation> op);

  std::mutex mu_;
  bool shutdown_ = false;
  grpc::CompletionQueue cq_;
};

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_DEFAULT_COMPLETION_QUEUE_IMPL_H
