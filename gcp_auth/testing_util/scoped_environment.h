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

#ifndef GCP_AUTH_TESTING_UTIL_SCOPED_ENVIRONMENT_H
#define GCP_AUTH_TESTING_UTIL_SCOPED_ENVIRONMENT_H

#include "gcp_auth/version.h"
#include "absl/types/optional.h"
#include <string>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace testing_util {

/**
 * Sets (or unsets) an environment variable, restoring the previous value on
 * destruction.
 *
 * If @p value is `absl::nullopt` the variable is unset.
 */
class ScopedEnvironment {
 public:
  ScopedEnvironment(std::string variable,
                    absl::optional<std::string> const& value);
  ~ScopedEnvironment();

  ScopedEnvironment(ScopedEnvironment const&) = delete;
  ScopedEnvironment(ScopedEnvironment&&) = default;
  ScopedEnvironment& operator=(ScopedEnvironment const&) = delete;
  ScopedEnvironment& operator=(ScopedEnvironment&&) = default;

 private:
  std::string variable_;
  absl::optional<std::string> prev_value_;
};

}  // namespace testing_util
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_TESTING_UTIL_SCOPED_ENVIRONMENT_H
