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

#include "gcp_auth/internal/header_layers.h"
#include "gcp_auth/auth_options.h"
#include "gcp_auth/internal/url_encode.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"

namespace gcp_auth {
namespace rest_internal {
GCP_AUTH_INLINE_NAMESPACE_BEGIN

future<StatusOr<std::unique_ptr<RestResponse>>> AttachHeaders::AsyncCall(
    CompletionQueue& cq, HttpMethod method, RestRequest request,
    std::string payload) {
  for (auto const& h : headers_) request.AddHeader(h);
  return child_->AsyncCall(cq, method, std::move(request), std::move(payload));
}

GoogRequestParam::GoogRequestParam(std::shared_ptr<HttpService> child,
                                   std::string value)
    : child_(std::move(child)),
      routing_([value = std::move(value)](RestRequest const&) {
        return absl::make_optional(value);
      }) {}

GoogRequestParam::GoogRequestParam(std::shared_ptr<HttpService> child,
                                   RoutingFunction routing)
    : child_(std::move(child)), routing_(std::move(routing)) {}

future<StatusOr<std::unique_ptr<RestResponse>>> GoogRequestParam::AsyncCall(
    CompletionQueue& cq, HttpMethod method, RestRequest request,
    std::string payload) {
  auto value = routing_(request);
  if (value && !value->empty()) {
    request.SetHeader("x-goog-request-params", *std::move(value));
  }
  return child_->AsyncCall(cq, method, std::move(request), std::move(payload));
}

RoutingFunction RoutingFromPath(std::string key, std::string segment) {
  return [key = std::move(key), segment = std::move(segment)](
             RestRequest const& request) -> absl::optional<std::string> {
    absl::string_view path = request.path();
    path = path.substr(0, path.find_first_of("?#"));
    std::vector<absl::string_view> parts =
        absl::StrSplit(path, '/', absl::SkipEmpty());
    for (std::size_t i = 0; i + 1 < parts.size(); ++i) {
      if (parts[i] != segment) continue;
      return absl::StrCat(key, "=", internal::UrlEncode(parts[i + 1]));
    }
    return absl::nullopt;
  };
}

HeaderList UserProjectHeaders(ProjectId const& project_id) {
  return {{"x-goog-user-project", project_id.value()}};
}

std::pair<std::string, std::string> UserAgentHeader(std::string product) {
  return {"user-agent", std::move(product)};
}

std::pair<std::string, std::string> UserAgentHeader() {
  return UserAgentHeader(internal::DefaultUserAgentProduct());
}

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace rest_internal
}  // namespace gcp_auth
