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

#include "gcp_auth/scopes.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include <iostream>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN

Scopes Scopes::Parse(absl::string_view encoded) {
  Scopes result;
  result.Insert(std::string(encoded));
  return result;
}

Scopes Scopes::WithScopes(Scopes existing, Scopes const& additional) {
  existing.scopes_.insert(additional.begin(), additional.end());
  return existing;
}

void Scopes::Insert(std::string scope) {
  for (auto s : absl::StrSplit(scope, absl::ByAnyChar(" \t\n\v\f\r"),
                               absl::SkipWhitespace())) {
    scopes_.emplace(s);
  }
}

std::string Scopes::Encode() const { return absl::StrJoin(scopes_, " "); }

std::ostream& operator<<(std::ostream& os, Scopes const& rhs) {
  return os << "[" << rhs.Encode() << "]";
}

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
