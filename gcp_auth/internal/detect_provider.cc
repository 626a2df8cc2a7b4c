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

#include "gcp_auth/internal/detect_provider.h"
#include "gcp_auth/internal/application_default_provider.h"
#include "gcp_auth/internal/async_blocking.h"
#include "gcp_auth/internal/emulator_provider.h"
#include "gcp_auth/internal/gcloud_provider.h"
#include "gcp_auth/internal/make_auth_error.h"
#include "gcp_auth/internal/metadata_server_provider.h"
#include "gcp_auth/internal/service_account_provider.h"
#include "gcp_auth/log.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include <memory>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

std::vector<ProviderProbe> DefaultProbes(Options const& options,
                                         HttpClientFactory client_factory) {
  return {
      {"emulator",
       [options](CompletionQueue&) -> ProbeOutcome {
         return TryLoadEmulator(options);
       }},
      {"service-account",
       [options, client_factory](CompletionQueue&) {
         return TryLoadServiceAccountFromEnv(options, client_factory);
       }},
      {"metadata-server",
       [options, client_factory](CompletionQueue& cq) {
         return TryLoadMetadataServer(cq, options, client_factory);
       }},
      {"gcloud",
       [options](CompletionQueue&) { return TryLoadGCloud(options); }},
      {"application-default",
       [options, client_factory](CompletionQueue& cq) {
         return TryLoadApplicationDefault(cq, options, client_factory);
       }},
  };
}

StatusOr<LoadProviderResult> RunProbes(
    CompletionQueue& cq, std::vector<ProviderProbe> const& probes) {
  std::vector<std::string> outcomes;
  for (auto const& p : probes) {
    auto r = p.probe(cq);
    if (!r) {
      GCP_AUTH_LOG(WARNING) << "credential provider " << p.name
                            << " failed to load: " << r.status();
      outcomes.push_back(absl::StrCat(p.name, ": ", r.status().message()));
      continue;
    }
    if (!r->has_value()) {
      GCP_AUTH_LOG(DEBUG) << "credential provider " << p.name
                          << " is not available";
      outcomes.push_back(absl::StrCat(p.name, ": not available"));
      continue;
    }
    return **std::move(r);
  }
  return NoProviderFoundError(
      absl::StrCat("no credential provider could be loaded [",
                   absl::StrJoin(outcomes, "; "), "]"),
      GCP_AUTH_ERROR_INFO());
}

future<StatusOr<LoadProviderResult>> DetectProvider(
    CompletionQueue cq, Options options, HttpClientFactory client_factory) {
  auto probes = std::make_shared<std::vector<ProviderProbe>>(
      DefaultProbes(options, std::move(client_factory)));
  return AsyncRunBlocking<LoadProviderResult>(
      cq, [cq, probes]() mutable { return RunProbes(cq, *probes); });
}

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
