// Copyright 2018 Google LLC
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

#ifndef GCP_AUTH_VERSION_H
#define GCP_AUTH_VERSION_H

#include "gcp_auth/internal/version_info.h"
#include <string>

#define GCP_AUTH_VCONCAT(Ma, Mi, Pa) v##Ma##_##Mi##_##Pa
#define GCP_AUTH_VEVAL(Ma, Mi, Pa) GCP_AUTH_VCONCAT(Ma, Mi, Pa)
#define GCP_AUTH_NS                                                  \
  GCP_AUTH_VEVAL(GCP_AUTH_VERSION_MAJOR, GCP_AUTH_VERSION_MINOR, \
                 GCP_AUTH_VERSION_PATCH)

/**
 * Versioned inline namespace that users should generally avoid spelling.
 *
 * The namespace is inlined, so applications can use `gcp_auth::Auth` in their
 * source, while the symbols are versioned, i.e., `gcp_auth::vXYZ::Auth`.
 */
#define GCP_AUTH_INLINE_NAMESPACE_BEGIN inline namespace GCP_AUTH_NS {
#define GCP_AUTH_INLINE_NAMESPACE_END } /* namespace GCP_AUTH_NS */

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN

/// The library major version.
int constexpr version_major() { return GCP_AUTH_VERSION_MAJOR; }

/// The library minor version.
int constexpr version_minor() { return GCP_AUTH_VERSION_MINOR; }

/// The library patch version.
int constexpr version_patch() { return GCP_AUTH_VERSION_PATCH; }

/// The library pre-release version, empty for released versions.
constexpr char const* version_pre_release() { return GCP_AUTH_PRE_RELEASE; }

namespace internal {
auto constexpr kMaxMinorVersions = 100;
auto constexpr kMaxPatchVersions = 100;
}  // namespace internal

/// A single integer representing the Major/Minor/Patch version.
int constexpr version() {
  static_assert(version_minor() < internal::kMaxMinorVersions,
                "version_minor() should be < kMaxMinorVersions");
  static_assert(version_patch() < internal::kMaxPatchVersions,
                "version_patch() should be < kMaxPatchVersions");
  return internal::kMaxPatchVersions *
             (internal::kMaxMinorVersions * version_major() + version_minor()) +
         version_patch();
}

/// The version as a string, in MAJOR.MINOR.PATCH[-PRE] format.
std::string version_string();

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_VERSION_H
