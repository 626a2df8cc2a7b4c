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

#include "gcp_auth/completion_queue.h"
#include "gcp_auth/internal/default_completion_queue_impl.h"

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN

CompletionQueue::CompletionQueue()
    : impl_(std::make_shared<internal::DefaultCompletionQueueImpl>()) {}

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
