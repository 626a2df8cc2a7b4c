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

#include "gcp_auth/internal/gcloud_provider.h"
#include "gcp_auth/auth_options.h"
#include "gcp_auth/internal/async_blocking.h"
#include "gcp_auth/internal/getenv.h"
#include "gcp_auth/internal/make_auth_error.h"
#include "gcp_auth/internal/token_endpoint.h"
#include "gcp_auth/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {
namespace {

auto constexpr kSubprocessFailureMetadata = "gcloud_exit_code";

}  // namespace

std::string RelevantGCloudOutput(std::string const& stdout_data) {
  auto line = absl::string_view(stdout_data);
  auto pos = line.find('\n');
  if (pos != absl::string_view::npos) line = line.substr(0, pos);
  return std::string(absl::StripAsciiWhitespace(line));
}

StatusOr<std::string> RunGCloud(std::string const& executable,
                                std::vector<std::string> const& args) {
  auto output = RunSubprocess(executable, args);
  if (!output) return std::move(output).status();
  auto value = RelevantGCloudOutput(output->stdout_data);
  if (output->exit_code == 0 && !value.empty()) return value;
  return SubprocessError(
      absl::StrCat("`", executable, " ", absl::StrJoin(args, " "),
                   "` exited with code ", output->exit_code,
                   value.empty() ? " and no output" : "", ": ",
                   absl::StripAsciiWhitespace(output->stderr_data)),
      GCP_AUTH_ERROR_INFO()
          .WithMetadata(kSubprocessFailureMetadata,
                        std::to_string(output->exit_code))
          .WithMetadata("empty_output", value.empty() ? "true" : "false"));
}

absl::optional<std::string> LocateGCloud(Options const& options) {
  if (options.has<GCloudExecutableOption>()) {
    return options.get<GCloudExecutableOption>();
  }
  auto path = GetEnv("PATH");
  if (!path.has_value()) return absl::nullopt;
  return FindExecutable("gcloud", *path);
}

GCloudProvider::GCloudProvider(std::string executable,
                               CurrentTimeFn current_time_fn,
                               RunGCloudFn run_gcloud)
    : executable_(std::move(executable)),
      current_time_fn_(std::move(current_time_fn)),
      run_gcloud_(std::move(run_gcloud)) {}

future<StatusOr<Token>> GCloudProvider::AsyncGetToken(CompletionQueue& cq,
                                                      Scopes const&) {
  auto self = shared_from_this();
  return AsyncRunBlocking<Token>(cq, [self] { return self->GetToken(); });
}

std::string GCloudProvider::name() const {
  return absl::StrCat("gcloud(", executable_, ")");
}

StatusOr<Token> GCloudProvider::GetToken() const {
  auto const now = current_time_fn_();
  auto token =
      run_gcloud_(executable_, {"auth", "print-access-token", "--quiet"});
  if (!token) return std::move(token).status();
  return Token::Create(*std::move(token), now, now + kAccessTokenLifetime);
}

StatusOr<std::string> GCloudProvider::GetProjectId() const {
  return run_gcloud_(executable_, {"config", "get-value", "project"});
}

ProbeOutcome TryLoadGCloud(Options const& options) {
  auto executable = LocateGCloud(options);
  if (!executable) {
    GCP_AUTH_LOG(DEBUG) << "gcloud executable not found";
    return absl::optional<LoadProviderResult>{};
  }
  auto provider = std::make_shared<GCloudProvider>(*std::move(executable));
  auto project_id = provider->GetProjectId();
  if (!project_id) {
    auto const& m = project_id.status().error_info().metadata();
    auto const l = m.find("empty_output");
    // A failure to start the process, or a failure with no output, means
    // gcloud is not usable in this environment.
    if (m.find(kSubprocessFailureMetadata) == m.end() ||
        (l != m.end() && l->second == "true")) {
      GCP_AUTH_LOG(DEBUG) << "gcloud not usable: " << project_id.status();
      return absl::optional<LoadProviderResult>{};
    }
    return std::move(project_id).status();
  }
  return absl::make_optional(LoadProviderResult{
      std::move(provider), ProjectId(*std::move(project_id)), {}});
}

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
