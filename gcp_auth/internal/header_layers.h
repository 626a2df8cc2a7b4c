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

#ifndef GCP_AUTH_INTERNAL_HEADER_LAYERS_H
#define GCP_AUTH_INTERNAL_HEADER_LAYERS_H

#include "gcp_auth/internal/http_service.h"
#include "gcp_auth/project_id.h"
#include "gcp_auth/version.h"
#include "absl/types/optional.h"
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace gcp_auth {
namespace rest_internal {
GCP_AUTH_INLINE_NAMESPACE_BEGIN

using HeaderList = std::vector<std::pair<std::string, std::string>>;

/// Adds a fixed set of headers to every request.
class AttachHeaders : public HttpService {
 public:
  AttachHeaders(std::shared_ptr<HttpService> child, HeaderList headers)
      : child_(std::move(child)), headers_(std::move(headers)) {}

  future<StatusOr<std::unique_ptr<RestResponse>>> AsyncCall(
      CompletionQueue& cq, HttpMethod method, RestRequest request,
      std::string payload) override;

 private:
  std::shared_ptr<HttpService> child_;
  HeaderList headers_;
};

/// Computes the `x-goog-request-params` value for a request, if any.
using RoutingFunction =
    std::function<absl::optional<std::string>(RestRequest const&)>;

/**
 * Adds the `x-goog-request-params` header used to route requests.
 *
 * The value is either fixed, or computed from each request. If the routing
 * function returns an empty optional the header is omitted.
 */
class GoogRequestParam : public HttpService {
 public:
  GoogRequestParam(std::shared_ptr<HttpService> child, std::string value);
  GoogRequestParam(std::shared_ptr<HttpService> child,
                   RoutingFunction routing);

  future<StatusOr<std::unique_ptr<RestResponse>>> AsyncCall(
      CompletionQueue& cq, HttpMethod method, RestRequest request,
      std::string payload) override;

 private:
  std::shared_ptr<HttpService> child_;
  RoutingFunction routing_;
};

/**
 * Extracts a routing parameter from the request path.
 *
 * The value is the path segment following @p segment. For example, with
 * `key == "bucket"` and `segment == "b"` the path `/storage/v1/b/my-bucket/o`
 * yields `bucket=my-bucket`. The value is URL-encoded.
 */
RoutingFunction RoutingFromPath(std::string key, std::string segment);

/// The `x-goog-user-project` header, billing requests to @p project_id.
HeaderList UserProjectHeaders(ProjectId const& project_id);

/// The `user-agent` header for @p product.
std::pair<std::string, std::string> UserAgentHeader(std::string product);

/// The `user-agent` header using the library's default product.
std::pair<std::string, std::string> UserAgentHeader();

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace rest_internal
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_HEADER_LAYERS_H
