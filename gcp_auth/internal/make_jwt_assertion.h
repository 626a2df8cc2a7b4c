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

#ifndef GCP_AUTH_INTERNAL_MAKE_JWT_ASSERTION_H
#define GCP_AUTH_INTERNAL_MAKE_JWT_ASSERTION_H

#include "gcp_auth/status_or.h"
#include "gcp_auth/version.h"
#include <string>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

/**
 * Creates a signed JWT: `base64url(header).base64url(payload).signature`.
 *
 * The signature is RSA-SHA256 over the first two components, using the PEM
 * key in @p pem_contents, and encoded with base64url without padding.
 */
StatusOr<std::string> MakeJWTAssertionNoThrow(std::string const& header,
                                              std::string const& payload,
                                              std::string const& pem_contents);

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_MAKE_JWT_ASSERTION_H
