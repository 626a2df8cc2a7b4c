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

#ifndef GCP_AUTH_INTERNAL_REFRESH_DRIVER_H
#define GCP_AUTH_INTERNAL_REFRESH_DRIVER_H

#include "gcp_auth/completion_queue.h"
#include "gcp_auth/future.h"
#include "gcp_auth/internal/backoff_policy.h"
#include "gcp_auth/status_or.h"
#include "gcp_auth/token.h"
#include "gcp_auth/version.h"
#include <functional>
#include <memory>
#include <string>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

/// Makes a single attempt to fetch a new token.
using AsyncTokenSource =
    std::function<future<StatusOr<Token>>(CompletionQueue&)>;

/**
 * Fetches a token from @p source, retrying transient failures.
 *
 * The first attempt starts immediately. After a transient failure the loop
 * waits for the delay given by @p backoff_policy and tries again, at most
 * @p max_retries times. Fatal errors (see `IsFatal()`) stop the loop. If all
 * the attempts fail the last error is returned. Errors are annotated with
 * @p provider_name.
 *
 * Cancelling the returned future stops the loop before the next attempt and
 * satisfies the future with a `kCancelled` error.
 */
future<StatusOr<Token>> RetryTokenFetch(
    CompletionQueue cq, AsyncTokenSource source, int max_retries,
    std::unique_ptr<BackoffPolicy> backoff_policy, std::string provider_name);

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_REFRESH_DRIVER_H
