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

#ifndef GCP_AUTH_TESTING_UTIL_MOCK_REST_CLIENT_H
#define GCP_AUTH_TESTING_UTIL_MOCK_REST_CLIENT_H

#include "gcp_auth/internal/rest_client.h"
#include "gcp_auth/internal/rest_response.h"
#include "gcp_auth/options.h"
#include "gcp_auth/version.h"
#include "absl/memory/memory.h"
#include <gmock/gmock.h>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace testing_util {

class MockRestClient : public rest_internal::RestClient {
 public:
  MOCK_METHOD(StatusOr<std::unique_ptr<rest_internal::RestResponse>>, Get,
              (rest_internal::RestRequest const&), (override));
  MOCK_METHOD(StatusOr<std::unique_ptr<rest_internal::RestResponse>>, Post,
              (rest_internal::RestRequest const&,
               std::vector<absl::Span<char const>> const&),
              (override));
  MOCK_METHOD(StatusOr<std::unique_ptr<rest_internal::RestResponse>>, Post,
              (rest_internal::RestRequest const&,
               (std::vector<std::pair<std::string, std::string>> const&)),
              (override));
};

class MockRestResponse : public rest_internal::RestResponse {
 public:
  MOCK_METHOD(rest_internal::HttpStatusCode, StatusCode, (), (const, override));
  MOCK_METHOD(std::string, ExtractPayload, (), (ref(&&), override));
};

/// Creates a response with the given status code and payload.
inline std::unique_ptr<rest_internal::RestResponse> MakeMockResponse(
    rest_internal::HttpStatusCode code, std::string payload) {
  auto response = absl::make_unique<::testing::NiceMock<MockRestResponse>>();
  ON_CALL(*response, StatusCode).WillByDefault(::testing::Return(code));
  ON_CALL(std::move(*response), ExtractPayload)
      .WillByDefault(::testing::Return(std::move(payload)));
  return response;
}

/// A factory returning @p client, for `HttpClientFactory` parameters.
inline std::function<std::unique_ptr<rest_internal::RestClient>(
    Options const&)>
MakeClientFactory(std::function<std::unique_ptr<MockRestClient>()> make) {
  return [make = std::move(make)](Options const&)
             -> std::unique_ptr<rest_internal::RestClient> { return make(); };
}

}  // namespace testing_util
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_TESTING_UTIL_MOCK_REST_CLIENT_H
