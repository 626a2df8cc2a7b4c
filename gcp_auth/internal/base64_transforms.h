// Copyright 2021 Google LLC
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

#ifndef GCP_AUTH_INTERNAL_BASE64_TRANSFORMS_H
#define GCP_AUTH_INTERNAL_BASE64_TRANSFORMS_H

#include "gcp_auth/status_or.h"
#include "gcp_auth/version.h"
#include "absl/strings/string_view.h"
#include <cstdint>
#include <string>
#include <vector>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

/// Encodes @p bytes using the URL-safe alphabet (RFC 4648 §5), without
/// padding.
std::string UrlsafeBase64Encode(absl::string_view bytes);
std::string UrlsafeBase64Encode(std::vector<std::uint8_t> const& bytes);

/// Decodes a URL-safe base64 string, with or without padding.
StatusOr<std::string> UrlsafeBase64Decode(std::string const& str);

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_BASE64_TRANSFORMS_H
