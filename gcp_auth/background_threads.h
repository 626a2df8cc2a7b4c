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

#ifndef GCP_AUTH_BACKGROUND_THREADS_H
#define GCP_AUTH_BACKGROUND_THREADS_H

#include "gcp_auth/completion_queue.h"
#include "gcp_auth/version.h"
#include <functional>
#include <memory>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN

/**
 * A object representing the background threads available to perform
 * background operations, such as token refreshes and retry timers.
 *
 * Destroying an object of this type stops the threads it created, if any.
 */
class BackgroundThreads {
 public:
  virtual ~BackgroundThreads() = default;

  /// The completion queue used for the background operations.
  virtual CompletionQueue cq() const = 0;
};

/// A factory for `BackgroundThreads` objects.
using BackgroundThreadsFactory =
    std::function<std::unique_ptr<BackgroundThreads>()>;

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_BACKGROUND_THREADS_H
