// Copyright 2020 Google LLC
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

#include "gcp_auth/testing_util/scoped_environment.h"
#include "gcp_auth/internal/getenv.h"
#include <cstdlib>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace testing_util {
namespace {

void SetEnv(char const* variable, absl::optional<std::string> const& value) {
  if (!value) {
    (void)::unsetenv(variable);
    return;
  }
  (void)::setenv(variable, value->c_str(), 1);
}

}  // namespace

ScopedEnvironment::ScopedEnvironment(std::string variable,
                                     absl::optional<std::string> const& value)
    : variable_(std::move(variable)),
      prev_value_(internal::GetEnv(variable_.c_str())) {
  SetEnv(variable_.c_str(), value);
}

ScopedEnvironment::~ScopedEnvironment() {
  SetEnv(variable_.c_str(), prev_value_);
}

}  // namespace testing_util
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
