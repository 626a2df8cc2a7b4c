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

#include "gcp_auth/testing_util/fake_completion_queue_impl.h"
#include "gcp_auth/internal/make_status.h"

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace testing_util {

void FakeCompletionQueueImpl::Run() {
  std::unique_lock<std::mutex> lk(mu_);
  cv_.wait(lk, [this] { return shutdown_; });
}

void FakeCompletionQueueImpl::Shutdown() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    shutdown_ = true;
  }
  for (auto& c : TakePending()) c(false);
  cv_.notify_all();
}

future<StatusOr<std::chrono::system_clock::time_point>>
FakeCompletionQueueImpl::MakeRelativeTimer(std::chrono::nanoseconds duration) {
  using std::chrono::system_clock;
  auto const deadline =
      system_clock::now() +
      std::chrono::duration_cast<system_clock::duration>(duration);
  auto p = std::make_shared<
      promise<StatusOr<std::chrono::system_clock::time_point>>>();
  auto f = p->get_future();
  Add([p, deadline](bool ok) {
    if (ok) return p->set_value(deadline);
    p->set_value(
        internal::CancelledError("timer cancelled", GCP_AUTH_ERROR_INFO()));
  });
  return f;
}

void FakeCompletionQueueImpl::RunAsync(
    std::unique_ptr<internal::AsyncTask> task) {
  std::shared_ptr<internal::AsyncTask> t(std::move(task));
  Add([t](bool ok) {
    if (ok) t->Run();
  });
}

void FakeCompletionQueueImpl::SimulateCompletion(bool ok) {
  for (auto batch = TakePending(); !batch.empty(); batch = TakePending()) {
    for (auto& c : batch) c(ok);
  }
}

void FakeCompletionQueueImpl::Add(Completion c) {
  std::unique_lock<std::mutex> lk(mu_);
  if (!shutdown_) {
    pending_.push_back(std::move(c));
    return;
  }
  lk.unlock();
  c(false);
}

std::vector<FakeCompletionQueueImpl::Completion>
FakeCompletionQueueImpl::TakePending() {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<Completion> result;
  result.swap(pending_);
  return result;
}

}  // namespace testing_util
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
