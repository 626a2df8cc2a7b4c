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

#ifndef GCP_AUTH_INTERNAL_GCLOUD_PROVIDER_H
#define GCP_AUTH_INTERNAL_GCLOUD_PROVIDER_H

#include "gcp_auth/internal/load_provider_result.h"
#include "gcp_auth/internal/subprocess.h"
#include "gcp_auth/options.h"
#include "gcp_auth/status_or.h"
#include "gcp_auth/token_provider.h"
#include "gcp_auth/version.h"
#include "absl/types/optional.h"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

/**
 * Returns the relevant part of the output of a `gcloud` command.
 *
 * `gcloud` may print additional messages (e.g. surveys) after the value, even
 * with `--quiet`. The output is truncated at the first newline and trimmed.
 */
std::string RelevantGCloudOutput(std::string const& stdout_data);

/**
 * Runs `gcloud` with @p args and returns its relevant output.
 *
 * A non-zero exit code or an empty output is reported as a `kSubprocess`
 * error, including the command's stderr.
 */
StatusOr<std::string> RunGCloud(std::string const& executable,
                                std::vector<std::string> const& args);

/**
 * Uses `GCloudExecutableOption` if set, otherwise searches `PATH` for
 * `gcloud`.
 */
absl::optional<std::string> LocateGCloud(Options const& options);

/**
 * Obtains access tokens by running `gcloud auth print-access-token`.
 *
 * The tokens use the credentials and scopes of the active `gcloud`
 * configuration, and are assumed to be valid for one hour.
 */
class GCloudProvider : public TokenProvider,
                       public std::enable_shared_from_this<GCloudProvider> {
 public:
  using CurrentTimeFn =
      std::function<std::chrono::system_clock::time_point()>;
  using RunGCloudFn = std::function<StatusOr<std::string>(
      std::string const&, std::vector<std::string> const&)>;

  explicit GCloudProvider(
      std::string executable,
      CurrentTimeFn current_time_fn = std::chrono::system_clock::now,
      RunGCloudFn run_gcloud = RunGCloud);

  future<StatusOr<Token>> AsyncGetToken(CompletionQueue& cq,
                                        Scopes const& scopes) override;
  ProviderKind kind() const override { return ProviderKind::kGCloud; }
  std::string name() const override;
  bool requires_scopes() const override { return false; }

  std::string const& executable() const { return executable_; }

  /// Blocking request for a new access token.
  StatusOr<Token> GetToken() const;

  /// Runs `gcloud config get-value project`.
  StatusOr<std::string> GetProjectId() const;

 private:
  std::string executable_;
  CurrentTimeFn current_time_fn_;
  RunGCloudFn run_gcloud_;
};

/**
 * Probes for a `gcloud` installation with a configured project.
 *
 * The provider is not available if `gcloud` is not found, or if it exits
 * with an error and prints nothing.
 */
ProbeOutcome TryLoadGCloud(Options const& options);

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_GCLOUD_PROVIDER_H
