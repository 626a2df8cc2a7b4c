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

#ifndef GCP_AUTH_INTERNAL_AUTH_SERVICE_H
#define GCP_AUTH_INTERNAL_AUTH_SERVICE_H

#include "gcp_auth/auth.h"
#include "gcp_auth/internal/http_service.h"
#include "gcp_auth/version.h"
#include <memory>
#include <string>

namespace gcp_auth {
namespace rest_internal {
GCP_AUTH_INLINE_NAMESPACE_BEGIN

/**
 * Adds an `authorization` header to each request.
 *
 * If the cached token is valid the request is forwarded immediately.
 * Otherwise the request waits for the refresh in progress. A failed refresh
 * terminates the request with an authentication error, see `IsAuthError()`.
 *
 * A response with status `401` or `403` revokes the token, which starts a new
 * refresh, and is returned to the caller unchanged. The request is not
 * retried.
 */
class AuthService : public HttpService {
 public:
  AuthService(std::shared_ptr<HttpService> child, Auth auth)
      : child_(std::move(child)), auth_(std::move(auth)) {}

  future<StatusOr<std::unique_ptr<RestResponse>>> AsyncCall(
      CompletionQueue& cq, HttpMethod method, RestRequest request,
      std::string payload) override;

 private:
  std::shared_ptr<HttpService> child_;
  Auth auth_;
};

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace rest_internal
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_AUTH_SERVICE_H
