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

#ifndef GCP_AUTH_INTERNAL_CREDENTIALS_FILE_H
#define GCP_AUTH_INTERNAL_CREDENTIALS_FILE_H

#include "gcp_auth/status_or.h"
#include "gcp_auth/version.h"
#include <string>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

/// The environment variable naming a credentials file.
auto constexpr kAdcEnvVar = "GOOGLE_APPLICATION_CREDENTIALS";

/// Returns the value of `GOOGLE_APPLICATION_CREDENTIALS`, or an empty string.
std::string AdcFilePathFromEnvVarOrEmpty();

/**
 * Returns the path of the file created by
 * `gcloud auth application-default login`.
 *
 * The file lives in `$CLOUDSDK_CONFIG` if set, or in `$HOME/.config/gcloud`.
 * Returns an empty string if neither variable is set. The file may not exist.
 */
std::string AdcFilePathFromWellKnownPathOrEmpty();

/// Reads a credentials file, failing with a `kCredentialShape` error.
StatusOr<std::string> ReadCredentialsFile(std::string const& path);

/**
 * Returns the `type` field of a JSON credentials file.
 *
 * Fails with a `kCredentialShape` error if @p contents is not a JSON object,
 * returns an empty string if it has no `type` field.
 */
StatusOr<std::string> CredentialsFileType(std::string const& contents,
                                          std::string const& source);

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_CREDENTIALS_FILE_H
