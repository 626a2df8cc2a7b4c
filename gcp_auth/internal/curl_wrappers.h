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

#ifndef GCP_AUTH_INTERNAL_CURL_WRAPPERS_H
#define GCP_AUTH_INTERNAL_CURL_WRAPPERS_H

#include "gcp_auth/status.h"
#include "gcp_auth/version.h"
#include <curl/curl.h>
#include <memory>
#include <string>

namespace gcp_auth {
namespace rest_internal {
GCP_AUTH_INLINE_NAMESPACE_BEGIN

/// Hold a CURL* handle and automatically clean it up.
using CurlPtr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

/// Create a new (wrapped) CURL* with one-time configuration options set.
CurlPtr MakeCurlPtr();

/// Hold a character string created by CURL use correct deleter.
using CurlString = std::unique_ptr<char, decltype(&curl_free)>;

using CurlHeaders = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

/// Escape @p s using the `application/x-www-form-urlencoded` rules.
std::string CurlEscape(CURL* handle, std::string const& s);

/**
 * Convert a CURLE_* error code to a `Status`.
 *
 * Failures to resolve or connect to the remote host are marked with a
 * `connect_error` metadata entry.
 */
Status CurlCodeToStatus(CURLcode e, char const* where);

/// Initializes libcurl and installs a SIGPIPE handler, at most once.
void CurlInitializeOnce();

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace rest_internal
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_CURL_WRAPPERS_H
