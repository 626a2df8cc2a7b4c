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

#ifndef GCP_AUTH_INTERNAL_SUBPROCESS_H
#define GCP_AUTH_INTERNAL_SUBPROCESS_H

#include "gcp_auth/status_or.h"
#include "gcp_auth/version.h"
#include "absl/types/optional.h"
#include <string>
#include <vector>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

struct SubprocessOutput {
  /// The exit code, or -1 if the process was terminated by a signal.
  int exit_code;
  std::string stdout_data;
  std::string stderr_data;
};

/**
 * Runs @p executable with @p args and waits for it to terminate.
 *
 * The child's stdin is `/dev/null`, its stdout and stderr are captured. Only
 * failures to start the process, or to collect its output, are reported as
 * errors (of kind `kSubprocess`).
 */
StatusOr<SubprocessOutput> RunSubprocess(std::string const& executable,
                                         std::vector<std::string> const& args);

/**
 * Searches the directories in @p path_env for an executable file named
 * @p name.
 *
 * @p path_env uses the same format as the `PATH` environment variable.
 */
absl::optional<std::string> FindExecutable(std::string const& name,
                                           std::string const& path_env);

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_SUBPROCESS_H
