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

#include "gcp_auth/internal/default_completion_queue_impl.h"
#include "gcp_auth/internal/make_status.h"
#include <grpcpp/alarm.h>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {
namespace {

using Operation = DefaultCompletionQueueImpl::Operation;
using Handle = std::shared_ptr<Operation>;
using TimerResult = StatusOr<std::chrono::system_clock::time_point>;

// AsyncNext() wakes up at least this often, so Run() notices Shutdown().
auto constexpr kPollPeriod = std::chrono::milliseconds(50);

class Timer : public Operation, public std::enable_shared_from_this<Timer> {
 public:
  explicit Timer(std::chrono::system_clock::time_point deadline)
      : deadline_(deadline) {}

  future<TimerResult> GetFuture() {
    std::weak_ptr<Timer> w = shared_from_this();
    promise_ = promise<TimerResult>([w] {
      if (auto self = w.lock()) self->alarm_.Cancel();
    });
    return promise_.get_future();
  }

  void Arm(grpc::CompletionQueue& cq, void* tag) override {
    alarm_.Set(&cq, deadline_, tag);
  }

  void Complete(bool ok) override {
    if (ok) return promise_.set_value(deadline_);
    promise_.set_value(CancelledError("timer cancelled", GCP_AUTH_ERROR_INFO()));
  }

 private:
  std::chrono::system_clock::time_point const deadline_;
  promise<TimerResult> promise_;
  grpc::Alarm alarm_;
};

// An alarm that expires immediately moves `task` to a thread in Run().
class Task : public Operation {
 public:
  explicit Task(std::unique_ptr<AsyncTask> task) : task_(std::move(task)) {}

  void Arm(grpc::CompletionQueue& cq, void* tag) override {
    alarm_.Set(&cq, std::chrono::system_clock::now(), tag);
  }

  void Complete(bool ok) override {
    auto task = std::move(task_);
    if (ok) task->Run();
  }

 private:
  std::unique_ptr<AsyncTask> task_;
  grpc::Alarm alarm_;
};

}  // namespace

void DefaultCompletionQueueImpl::Run() {
  void* tag;
  bool ok;
  for (;;) {
    auto const status = cq_.AsyncNext(
        &tag, &ok, std::chrono::system_clock::now() + kPollPeriod);
    if (status == grpc::CompletionQueue::SHUTDOWN) return;
    if (status != grpc::CompletionQueue::GOT_EVENT) continue;
    std::unique_ptr<Handle> handle(static_cast<Handle*>(tag));
    (*handle)->Complete(ok);
  }
}

void DefaultCompletionQueueImpl::Shutdown() {
  std::lock_guard<std::mutex> lk(mu_);
  if (shutdown_) return;
  shutdown_ = true;
  cq_.Shutdown();
}

future<TimerResult> DefaultCompletionQueueImpl::MakeRelativeTimer(
    std::chrono::nanoseconds duration) {
  using std::chrono::system_clock;
  auto timer = std::make_shared<Timer>(
      system_clock::now() +
      std::chrono::duration_cast<system_clock::duration>(duration));
  auto f = timer->GetFuture();
  Start(std::move(timer));
  return f;
}

void DefaultCompletionQueueImpl::RunAsync(std::unique_ptr<AsyncTask> task) {
  Start(std::make_shared<Task>(std::move(task)));
}

// Alarms cannot be set on a queue after cq_.Shutdown(), `mu_` orders both.
void DefaultCompletionQueueImpl::Start(std::shared_ptr<Operation> op) {
  std::unique_lock<std::mutex> lk(mu_);
  if (shutdown_) {
    lk.unlock();
    op->Complete(false);
    return;
  }
  auto* raw = op.get();
  raw->Arm(cq_, new Handle(std::move(op)));
}

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
