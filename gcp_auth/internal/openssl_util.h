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

#ifndef GCP_AUTH_INTERNAL_OPENSSL_UTIL_H
#define GCP_AUTH_INTERNAL_OPENSSL_UTIL_H

#include "gcp_auth/status_or.h"
#include "gcp_auth/version.h"
#include <cstdint>
#include <string>
#include <vector>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

/**
 * Signs @p str with RSA-SHA256 (PKCS#1 v1.5) using the PEM private key in
 * @p pem_contents.
 *
 * Errors, including a PEM key that OpenSSL rejects, are reported as
 * `AuthErrorKind::kCrypto` errors.
 */
StatusOr<std::vector<std::uint8_t>> SignUsingSha256(
    std::string const& str, std::string const& pem_contents);

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_OPENSSL_UTIL_H
