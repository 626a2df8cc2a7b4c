// Copyright 2022 Google LLC
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

#ifndef GCP_AUTH_INTERNAL_MAKE_STATUS_H
#define GCP_AUTH_INTERNAL_MAKE_STATUS_H

#include "gcp_auth/status.h"
#include "gcp_auth/version.h"
#include "absl/strings/string_view.h"
#include <string>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

/**
 * Collects the `ErrorInfo` of a new `Status`.
 *
 * Use `GCP_AUTH_ERROR_INFO()` to record the source location:
 *
 * @code
 * return InvalidArgumentError(
 *     "bad base64 input", GCP_AUTH_ERROR_INFO().WithMetadata("size", n));
 * @endcode
 *
 * The domain defaults to "gcp-auth-cpp" and the reason to the name of the
 * status code.
 */
class ErrorInfoBuilder {
 public:
  ErrorInfoBuilder(char const* file, int line, char const* function);

  /// The first value recorded for a key wins.
  ErrorInfoBuilder&& WithMetadata(absl::string_view key,
                                  absl::string_view value) &&;
  ErrorInfoBuilder&& WithReason(std::string reason) &&;
  ErrorInfoBuilder&& WithDomain(std::string domain) &&;

  ErrorInfo Build(StatusCode code) &&;

 private:
  std::string reason_;
  std::string domain_;
  ErrorInfo::Metadata metadata_;
};

#define GCP_AUTH_ERROR_INFO() \
  ::gcp_auth::internal::ErrorInfoBuilder(__FILE__, __LINE__, __func__)

Status MakeStatus(StatusCode code, std::string msg, ErrorInfoBuilder b);

Status CancelledError(std::string msg, ErrorInfoBuilder b);
Status UnknownError(std::string msg, ErrorInfoBuilder b);
Status InvalidArgumentError(std::string msg, ErrorInfoBuilder b);
Status DeadlineExceededError(std::string msg, ErrorInfoBuilder b);
Status InternalError(std::string msg, ErrorInfoBuilder b);
Status UnavailableError(std::string msg, ErrorInfoBuilder b);

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_MAKE_STATUS_H
