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

#ifndef GCP_AUTH_PROVIDER_KIND_H
#define GCP_AUTH_PROVIDER_KIND_H

#include "gcp_auth/version.h"
#include <iosfwd>
#include <string>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN

/// The type of credentials used by a `TokenProvider`.
enum class ProviderKind {
  kServiceAccount,
  kMetadataServer,
  kGCloud,
  kAuthorizedUser,
  kImpersonatedServiceAccount,
  kApplicationDefault,
  kEmulator,
  kScoped,
};

/// A stable name, e.g. `service-account`, used in logs and error metadata.
std::string ProviderKindName(ProviderKind kind);

std::ostream& operator<<(std::ostream& os, ProviderKind kind);

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_PROVIDER_KIND_H
