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

#include "gcp_auth/internal/rest_request.h"
#include "absl/strings/ascii.h"

namespace gcp_auth {
namespace rest_internal {
GCP_AUTH_INLINE_NAMESPACE_BEGIN

RestRequest& RestRequest::SetPath(std::string path) {
  path_ = std::move(path);
  return *this;
}

RestRequest& RestRequest::AddHeader(std::string name, std::string value) {
  headers_[absl::AsciiStrToLower(name)].push_back(std::move(value));
  return *this;
}

RestRequest& RestRequest::SetHeader(std::string name, std::string value) {
  headers_[absl::AsciiStrToLower(name)] = {std::move(value)};
  return *this;
}

std::vector<std::string> RestRequest::GetHeader(std::string name) const {
  auto const it = headers_.find(absl::AsciiStrToLower(name));
  if (it == headers_.end()) return {};
  return it->second;
}

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace rest_internal
}  // namespace gcp_auth
