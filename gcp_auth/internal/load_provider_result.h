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

#ifndef GCP_AUTH_INTERNAL_LOAD_PROVIDER_RESULT_H
#define GCP_AUTH_INTERNAL_LOAD_PROVIDER_RESULT_H

#include "gcp_auth/future.h"
#include "gcp_auth/project_id.h"
#include "gcp_auth/status_or.h"
#include "gcp_auth/token.h"
#include "gcp_auth/token_provider.h"
#include "gcp_auth/version.h"
#include "absl/types/optional.h"
#include <memory>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

/**
 * A provider that loaded successfully, and the project it resolved.
 *
 * Some providers request the first token while loading, if so `token` is a
 * valid future.
 */
struct LoadProviderResult {
  std::shared_ptr<TokenProvider> provider;
  ProjectId project_id;
  future<StatusOr<Token>> token;
};

/**
 * The outcome of probing a provider.
 *
 * An empty optional means the provider is not available in this environment.
 * An error means the provider is present but could not be loaded.
 */
using ProbeOutcome = StatusOr<absl::optional<LoadProviderResult>>;

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_LOAD_PROVIDER_RESULT_H
