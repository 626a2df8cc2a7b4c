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

#ifndef GCP_AUTH_INTERNAL_DETECT_PROVIDER_H
#define GCP_AUTH_INTERNAL_DETECT_PROVIDER_H

#include "gcp_auth/completion_queue.h"
#include "gcp_auth/future.h"
#include "gcp_auth/internal/http_client_factory.h"
#include "gcp_auth/internal/load_provider_result.h"
#include "gcp_auth/options.h"
#include "gcp_auth/status_or.h"
#include "gcp_auth/version.h"
#include <functional>
#include <string>
#include <vector>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

/// A named step in the provider detection.
struct ProviderProbe {
  std::string name;
  std::function<ProbeOutcome(CompletionQueue&)> probe;
};

/**
 * The probes used by `DetectProvider()`, in order.
 *
 * The order is: emulator, service account from
 * `GOOGLE_APPLICATION_CREDENTIALS`, metadata server, `gcloud`, and
 * Application Default Credentials.
 */
std::vector<ProviderProbe> DefaultProbes(Options const& options,
                                         HttpClientFactory client_factory);

/**
 * Runs @p probes in order, returning the first provider that loads.
 *
 * Probes reporting the provider is not available are skipped, probes that
 * fail are logged and skipped. If no probe succeeds the result is a
 * `kNoProviderFound` error listing the outcome of each probe.
 *
 * This blocks the calling thread.
 */
StatusOr<LoadProviderResult> RunProbes(CompletionQueue& cq,
                                       std::vector<ProviderProbe> const& probes);

/// Runs the default probes in one of the threads servicing @p cq.
future<StatusOr<LoadProviderResult>> DetectProvider(
    CompletionQueue cq, Options options, HttpClientFactory client_factory);

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_DETECT_PROVIDER_H
