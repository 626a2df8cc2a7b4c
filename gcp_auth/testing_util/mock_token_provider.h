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

#ifndef GCP_AUTH_TESTING_UTIL_MOCK_TOKEN_PROVIDER_H
#define GCP_AUTH_TESTING_UTIL_MOCK_TOKEN_PROVIDER_H

#include "gcp_auth/token_provider.h"
#include "gcp_auth/version.h"
#include <gmock/gmock.h>
#include <string>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace testing_util {

class MockTokenProvider : public TokenProvider {
 public:
  MOCK_METHOD(future<StatusOr<Token>>, AsyncGetToken,
              (CompletionQueue&, Scopes const&), (override));
  MOCK_METHOD(ProviderKind, kind, (), (const, override));
  MOCK_METHOD(std::string, name, (), (const, override));
  MOCK_METHOD(bool, requires_scopes, (), (const, override));
};

}  // namespace testing_util
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_TESTING_UTIL_MOCK_TOKEN_PROVIDER_H
