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

#ifndef GCP_AUTH_TESTING_UTIL_FAKE_COMPLETION_QUEUE_IMPL_H
#define GCP_AUTH_TESTING_UTIL_FAKE_COMPLETION_QUEUE_IMPL_H

#include "gcp_auth/internal/completion_queue_impl.h"
#include "gcp_auth/version.h"
#include <condition_variable>
#include <functional>
#include <mutex>
#include <vector>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace testing_util {

/**
 * A completion queue where timers and tasks wait until the test completes
 * them.
 *
 * @code
 * auto fake = std::make_shared<FakeCompletionQueueImpl>();
 * CompletionQueue cq(fake);
 * auto timer = cq.MakeRelativeTimer(std::chrono::seconds(30));
 * fake->SimulateCompletion(true);  // timer.get() is now the deadline
 * @endcode
 */
class FakeCompletionQueueImpl : public internal::CompletionQueueImpl {
 public:
  void Run() override;
  void Shutdown() override;
  future<StatusOr<std::chrono::system_clock::time_point>> MakeRelativeTimer(
      std::chrono::nanoseconds duration) override;
  void RunAsync(std::unique_ptr<internal::AsyncTask> task) override;

  /// Completes every pending operation, including those created while doing
  /// so.
  void SimulateCompletion(bool ok);

  bool empty() const { return size() == 0; }
  std::size_t size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return pending_.size();
  }

 private:
  using Completion = std::function<void(bool)>;

  void Add(Completion c);
  std::vector<Completion> TakePending();

  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool shutdown_ = false;
  std::vector<Completion> pending_;
};

}  // namespace testing_util
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_TESTING_UTIL_FAKE_COMPLETION_QUEUE_IMPL_H
