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

#ifndef GCP_AUTH_INTERNAL_CURL_REST_CLIENT_H
#define GCP_AUTH_INTERNAL_CURL_REST_CLIENT_H

#include "gcp_auth/internal/curl_wrappers.h"
#include "gcp_auth/internal/rest_client.h"
#include "gcp_auth/options.h"
#include "gcp_auth/version.h"
#include <string>

namespace gcp_auth {
namespace rest_internal {
GCP_AUTH_INLINE_NAMESPACE_BEGIN

/**
 * Implements `RestClient` with one libcurl easy handle per request.
 *
 * Token endpoints are contacted rarely, so this class does not pool handles.
 */
class CurlRestClient : public RestClient {
 public:
  CurlRestClient(std::string endpoint_address, Options options);
  ~CurlRestClient() override = default;

  CurlRestClient(CurlRestClient const&) = delete;
  CurlRestClient& operator=(CurlRestClient const&) = delete;

  StatusOr<std::unique_ptr<RestResponse>> Get(
      RestRequest const& request) override;
  StatusOr<std::unique_ptr<RestResponse>> Post(
      RestRequest const& request,
      std::vector<absl::Span<char const>> const& payload) override;
  StatusOr<std::unique_ptr<RestResponse>> Post(
      RestRequest const& request,
      std::vector<std::pair<std::string, std::string>> const& form_data)
      override;

  /// Returns the URL used for @p request, including the query parameters.
  std::string BuildUrl(RestRequest const& request) const;

 private:
  StatusOr<std::unique_ptr<RestResponse>> MakeRequest(
      CurlPtr handle, RestRequest const& request, std::string const* payload);

  std::string endpoint_address_;
  Options options_;
};

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace rest_internal
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_CURL_REST_CLIENT_H
