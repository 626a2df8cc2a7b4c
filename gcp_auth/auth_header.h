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

#ifndef GCP_AUTH_AUTH_HEADER_H
#define GCP_AUTH_AUTH_HEADER_H

#include "gcp_auth/future.h"
#include "gcp_auth/status_or.h"
#include "gcp_auth/version.h"
#include "absl/types/variant.h"
#include <chrono>
#include <string>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN

/// The value for an `authorization` header, and how long it remains usable.
struct AuthHeader {
  std::string value;
  std::chrono::system_clock::duration valid_for;
};

inline bool operator==(AuthHeader const& a, AuthHeader const& b) {
  return a.value == b.value && a.valid_for == b.valid_for;
}
inline bool operator!=(AuthHeader const& a, AuthHeader const& b) {
  return !(a == b);
}

/**
 * Either a header that is valid now, or a future satisfied when a new token
 * is available.
 */
using HeaderResult = absl::variant<AuthHeader, future<StatusOr<AuthHeader>>>;

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_AUTH_HEADER_H
