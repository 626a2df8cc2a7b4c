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

#ifndef GCP_AUTH_INTERNAL_REST_CLIENT_H
#define GCP_AUTH_INTERNAL_REST_CLIENT_H

#include "gcp_auth/internal/rest_request.h"
#include "gcp_auth/internal/rest_response.h"
#include "gcp_auth/options.h"
#include "gcp_auth/status_or.h"
#include "gcp_auth/version.h"
#include "absl/types/span.h"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace gcp_auth {
namespace rest_internal {
GCP_AUTH_INLINE_NAMESPACE_BEGIN

/**
 * The minimal HTTP client used to contact token endpoints.
 *
 * All the member functions block until the full response is received.
 * Failures to send the request or receive the response are reported as a
 * `Status`. Any HTTP response, including error responses, is returned as a
 * `RestResponse`.
 */
class RestClient {
 public:
  virtual ~RestClient() = default;
  virtual StatusOr<std::unique_ptr<RestResponse>> Get(
      RestRequest const& request) = 0;
  virtual StatusOr<std::unique_ptr<RestResponse>> Post(
      RestRequest const& request,
      std::vector<absl::Span<char const>> const& payload) = 0;
  virtual StatusOr<std::unique_ptr<RestResponse>> Post(
      RestRequest const& request,
      std::vector<std::pair<std::string, std::string>> const& form_data) = 0;
};

/**
 * Creates a `RestClient` using libcurl.
 *
 * Request paths are relative to @p endpoint_address, unless they are absolute
 * `http://` or `https://` URLs. The client uses `HttpTimeoutOption` and
 * `UserAgentProductOption` from @p options.
 */
std::unique_ptr<RestClient> MakeDefaultRestClient(std::string endpoint_address,
                                                  Options options);

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace rest_internal
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_REST_CLIENT_H
