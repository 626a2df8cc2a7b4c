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

#ifndef GCP_AUTH_TESTING_UTIL_MOCK_HTTP_SERVICE_H
#define GCP_AUTH_TESTING_UTIL_MOCK_HTTP_SERVICE_H

#include "gcp_auth/internal/http_service.h"
#include "gcp_auth/version.h"
#include <gmock/gmock.h>
#include <memory>
#include <string>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace testing_util {

class MockHttpService : public rest_internal::HttpService {
 public:
  MOCK_METHOD(future<StatusOr<std::unique_ptr<rest_internal::RestResponse>>>,
              AsyncCall,
              (CompletionQueue&, rest_internal::HttpMethod,
               rest_internal::RestRequest, std::string),
              (override));
};

}  // namespace testing_util
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_TESTING_UTIL_MOCK_HTTP_SERVICE_H
