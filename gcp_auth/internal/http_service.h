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

#ifndef GCP_AUTH_INTERNAL_HTTP_SERVICE_H
#define GCP_AUTH_INTERNAL_HTTP_SERVICE_H

#include "gcp_auth/completion_queue.h"
#include "gcp_auth/future.h"
#include "gcp_auth/internal/rest_client.h"
#include "gcp_auth/internal/rest_request.h"
#include "gcp_auth/internal/rest_response.h"
#include "gcp_auth/status_or.h"
#include "gcp_auth/version.h"
#include <iosfwd>
#include <memory>
#include <string>

namespace gcp_auth {
namespace rest_internal {
GCP_AUTH_INLINE_NAMESPACE_BEGIN

enum class HttpMethod { kGet, kPost };

std::ostream& operator<<(std::ostream& os, HttpMethod method);

/**
 * An asynchronous HTTP service, the unit composed by the request decorators.
 *
 * Decorators such as `AuthService` or `AttachHeaders` wrap another
 * `HttpService`, modify the request, and forward it.
 */
class HttpService {
 public:
  virtual ~HttpService() = default;

  virtual future<StatusOr<std::unique_ptr<RestResponse>>> AsyncCall(
      CompletionQueue& cq, HttpMethod method, RestRequest request,
      std::string payload) = 0;
};

/**
 * Adapts a blocking `RestClient` to `HttpService`.
 *
 * The requests run in the threads servicing the completion queue. The
 * payload of a `kPost` request is sent as-is, callers set any
 * `content-type` header.
 */
std::shared_ptr<HttpService> MakeRestClientService(
    std::shared_ptr<RestClient> client);

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace rest_internal
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_HTTP_SERVICE_H
