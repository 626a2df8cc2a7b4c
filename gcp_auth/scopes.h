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

#ifndef GCP_AUTH_SCOPES_H
#define GCP_AUTH_SCOPES_H

#include "gcp_auth/version.h"
#include "absl/strings/string_view.h"
#include <initializer_list>
#include <iosfwd>
#include <set>
#include <string>
#include <vector>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN

/// Well-known OAuth2 scopes.
namespace scopes {
auto constexpr kCloudPlatform =
    "https://www.googleapis.com/auth/cloud-platform";
auto constexpr kCloudPlatformReadOnly =
    "https://www.googleapis.com/auth/cloud-platform.read-only";
auto constexpr kDevstorageReadOnly =
    "https://www.googleapis.com/auth/devstorage.read_only";
auto constexpr kDevstorageReadWrite =
    "https://www.googleapis.com/auth/devstorage.read_write";
auto constexpr kDevstorageFullControl =
    "https://www.googleapis.com/auth/devstorage.full_control";
auto constexpr kBigQuery = "https://www.googleapis.com/auth/bigquery";
auto constexpr kPubSub = "https://www.googleapis.com/auth/pubsub";
auto constexpr kSpannerData = "https://www.googleapis.com/auth/spanner.data";
auto constexpr kDatastore = "https://www.googleapis.com/auth/datastore";
auto constexpr kCloudTasks = "https://www.googleapis.com/auth/cloud-tasks";
auto constexpr kFirebase = "https://www.googleapis.com/auth/firebase";
}  // namespace scopes

/**
 * An ordered set of OAuth2 scopes.
 *
 * The canonical form is the sorted, space-separated list of scopes. Two sets
 * are equal if and only if their canonical forms are equal.
 */
class Scopes {
 public:
  using const_iterator = std::set<std::string>::const_iterator;

  Scopes() = default;
  Scopes(std::initializer_list<std::string> scopes) {
    for (auto const& s : scopes) Insert(s);
  }
  explicit Scopes(std::vector<std::string> const& scopes) {
    for (auto const& s : scopes) Insert(s);
  }

  /// Parses a whitespace-separated list, ignoring empty elements.
  static Scopes Parse(absl::string_view encoded);

  /// Returns the union of @p existing and @p additional.
  static Scopes WithScopes(Scopes existing, Scopes const& additional);

  /**
   * Adds @p scope, ignoring duplicates and empty strings.
   *
   * Whitespace is never part of a scope: surrounding whitespace is dropped and
   * a string with embedded whitespace adds each element.
   */
  void Insert(std::string scope);

  /// The canonical encoding, as used in the `scope` claim of a JWT.
  std::string Encode() const;

  std::vector<std::string> AsVector() const {
    return {scopes_.begin(), scopes_.end()};
  }

  const_iterator begin() const { return scopes_.begin(); }
  const_iterator end() const { return scopes_.end(); }
  bool empty() const { return scopes_.empty(); }
  std::size_t size() const { return scopes_.size(); }

  friend bool operator==(Scopes const& a, Scopes const& b) {
    return a.scopes_ == b.scopes_;
  }
  friend bool operator!=(Scopes const& a, Scopes const& b) {
    return !(a == b);
  }

 private:
  std::set<std::string> scopes_;
};

std::ostream& operator<<(std::ostream& os, Scopes const& rhs);

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_SCOPES_H
