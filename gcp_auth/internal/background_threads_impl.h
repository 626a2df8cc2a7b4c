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

#ifndef GCP_AUTH_INTERNAL_BACKGROUND_THREADS_IMPL_H
#define GCP_AUTH_INTERNAL_BACKGROUND_THREADS_IMPL_H

#include "gcp_auth/background_threads.h"
#include "gcp_auth/completion_queue.h"
#include "gcp_auth/version.h"
#include <thread>
#include <vector>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

/// Assume the user has provided the background threads and use them.
class CustomerSuppliedBackgroundThreads : public BackgroundThreads {
 public:
  explicit CustomerSuppliedBackgroundThreads(CompletionQueue cq)
      : cq_(std::move(cq)) {}
  ~CustomerSuppliedBackgroundThreads() override = default;

  CompletionQueue cq() const override { return cq_; }

 private:
  CompletionQueue cq_;
};

/// Create a pool of threads running the event loop of a new completion queue.
class AutomaticallyCreatedBackgroundThreads : public BackgroundThreads {
 public:
  explicit AutomaticallyCreatedBackgroundThreads(std::size_t thread_count = 1);
  ~AutomaticallyCreatedBackgroundThreads() override;

  CompletionQueue cq() const override { return cq_; }
  void Shutdown();
  std::size_t pool_size() const { return pool_.size(); }

 private:
  CompletionQueue cq_;
  std::vector<std::thread> pool_;
};

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_BACKGROUND_THREADS_IMPL_H
