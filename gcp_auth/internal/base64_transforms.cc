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

#include "gcp_auth/internal/base64_transforms.h"
#include "gcp_auth/internal/make_status.h"
#include "absl/strings/escaping.h"

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

std::string UrlsafeBase64Encode(absl::string_view bytes) {
  return absl::WebSafeBase64Escape(bytes);
}

std::string UrlsafeBase64Encode(std::vector<std::uint8_t> const& bytes) {
  return UrlsafeBase64Encode(absl::string_view(
      reinterpret_cast<char const*>(bytes.data()), bytes.size()));
}

StatusOr<std::string> UrlsafeBase64Decode(std::string const& str) {
  std::string decoded;
  if (!absl::WebSafeBase64Unescape(str, &decoded)) {
    return InvalidArgumentError("Invalid base64 chunk <" + str + ">",
                                GCP_AUTH_ERROR_INFO());
  }
  return decoded;
}

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
