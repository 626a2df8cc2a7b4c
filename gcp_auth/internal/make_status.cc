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

#include "gcp_auth/internal/make_status.h"

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

ErrorInfoBuilder::ErrorInfoBuilder(char const* file, int line,
                                   char const* function)
    : domain_("gcp-auth-cpp"),
      metadata_{{"gcp-auth-cpp.version", version_string()},
                {"gcp-auth-cpp.source.filename", file},
                {"gcp-auth-cpp.source.line", std::to_string(line)},
                {"gcp-auth-cpp.source.function", function}} {}

ErrorInfoBuilder&& ErrorInfoBuilder::WithMetadata(absl::string_view key,
                                                  absl::string_view value) && {
  metadata_.emplace(std::string(key), std::string(value));
  return std::move(*this);
}

ErrorInfoBuilder&& ErrorInfoBuilder::WithReason(std::string reason) && {
  reason_ = std::move(reason);
  return std::move(*this);
}

ErrorInfoBuilder&& ErrorInfoBuilder::WithDomain(std::string domain) && {
  domain_ = std::move(domain);
  return std::move(*this);
}

ErrorInfo ErrorInfoBuilder::Build(StatusCode code) && {
  if (reason_.empty()) reason_ = StatusCodeToString(code);
  return ErrorInfo(std::move(reason_), std::move(domain_),
                   std::move(metadata_));
}

Status MakeStatus(StatusCode code, std::string msg, ErrorInfoBuilder b) {
  auto info = std::move(b).Build(code);
  return Status(code, std::move(msg), std::move(info));
}

Status CancelledError(std::string msg, ErrorInfoBuilder b) {
  return MakeStatus(StatusCode::kCancelled, std::move(msg), std::move(b));
}

Status UnknownError(std::string msg, ErrorInfoBuilder b) {
  return MakeStatus(StatusCode::kUnknown, std::move(msg), std::move(b));
}

Status InvalidArgumentError(std::string msg, ErrorInfoBuilder b) {
  return MakeStatus(StatusCode::kInvalidArgument, std::move(msg),
                    std::move(b));
}

Status DeadlineExceededError(std::string msg, ErrorInfoBuilder b) {
  return MakeStatus(StatusCode::kDeadlineExceeded, std::move(msg),
                    std::move(b));
}

Status InternalError(std::string msg, ErrorInfoBuilder b) {
  return MakeStatus(StatusCode::kInternal, std::move(msg), std::move(b));
}

Status UnavailableError(std::string msg, ErrorInfoBuilder b) {
  return MakeStatus(StatusCode::kUnavailable, std::move(msg), std::move(b));
}

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
