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

#ifndef GCP_AUTH_INTERNAL_PARSE_RFC3339_H
#define GCP_AUTH_INTERNAL_PARSE_RFC3339_H

#include "gcp_auth/status_or.h"
#include "gcp_auth/version.h"
#include <chrono>
#include <string>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

/**
 * Parses @p timestamp in RFC-3339 format.
 *
 * @see https://tools.ietf.org/html/rfc3339
 */
StatusOr<std::chrono::system_clock::time_point> ParseRfc3339(
    std::string const& timestamp);

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_PARSE_RFC3339_H
