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

#ifndef GCP_AUTH_PROJECT_ID_H
#define GCP_AUTH_PROJECT_ID_H

#include "gcp_auth/version.h"
#include <iosfwd>
#include <memory>
#include <string>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN

/**
 * The project resolved while detecting the credentials.
 *
 * Copies share the same immutable string.
 */
class ProjectId {
 public:
  explicit ProjectId(std::string value)
      : value_(std::make_shared<std::string const>(std::move(value))) {}

  std::string const& value() const { return *value_; }

  friend bool operator==(ProjectId const& a, ProjectId const& b) {
    return a.value() == b.value();
  }
  friend bool operator!=(ProjectId const& a, ProjectId const& b) {
    return !(a == b);
  }

 private:
  std::shared_ptr<std::string const> value_;
};

std::ostream& operator<<(std::ostream& os, ProjectId const& rhs);

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_PROJECT_ID_H
