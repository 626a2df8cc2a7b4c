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

#include "gcp_auth/internal/application_default_provider.h"
#include "gcp_auth/internal/authorized_user_provider.h"
#include "gcp_auth/internal/credentials_file.h"
#include "gcp_auth/internal/impersonated_service_account_provider.h"
#include "gcp_auth/internal/make_auth_error.h"
#include "gcp_auth/internal/metadata_server_provider.h"
#include "gcp_auth/internal/service_account_provider.h"
#include "gcp_auth/log.h"
#include "absl/strings/str_cat.h"
#include <sys/stat.h>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {
namespace {

Status MissingProjectError(std::string const& source) {
  return CredentialShapeError(
      "cannot determine the project id from the credentials in " + source,
      GCP_AUTH_ERROR_INFO());
}

StatusOr<LoadProviderResult> LoadAuthorizedUser(std::string const& contents,
                                                std::string const& source,
                                                Options const& options,
                                                HttpClientFactory factory) {
  auto info = ParseAuthorizedUserCredentials(contents, source);
  if (!info) return std::move(info).status();
  if (!info->quota_project_id) return MissingProjectError(source);
  auto project_id = ProjectId(*info->quota_project_id);
  return LoadProviderResult{
      std::make_shared<AuthorizedUserProvider>(*std::move(info), options,
                                               std::move(factory)),
      std::move(project_id),
      {}};
}

StatusOr<LoadProviderResult> LoadImpersonated(std::string const& contents,
                                              std::string const& source,
                                              Options const& options,
                                              HttpClientFactory factory) {
  auto info = ParseImpersonatedServiceAccountCredentials(contents, source);
  if (!info) return std::move(info).status();
  auto project_id = info->source_credentials.quota_project_id;
  if (!project_id) {
    project_id =
        ProjectIdFromImpersonationUrl(info->service_account_impersonation_url);
  }
  if (!project_id) return MissingProjectError(source);
  auto user = std::make_shared<AuthorizedUserProvider>(
      std::move(info->source_credentials), options, factory);
  return LoadProviderResult{
      std::make_shared<ImpersonatedServiceAccountProvider>(
          std::move(user), std::move(info->service_account_impersonation_url),
          std::move(info->delegates), options, std::move(factory)),
      ProjectId(*std::move(project_id)),
      {}};
}

bool FileExists(std::string const& path) {
  struct stat sb;
  return ::stat(path.c_str(), &sb) == 0 && S_ISREG(sb.st_mode);
}

LoadProviderResult Wrap(LoadProviderResult r) {
  r.provider = std::make_shared<ApplicationDefaultProvider>(std::move(r.provider));
  return r;
}

}  // namespace

std::string ApplicationDefaultProvider::name() const {
  return absl::StrCat("application-default(", inner_->name(), ")");
}

StatusOr<LoadProviderResult> LoadCredentialsFile(
    std::string const& contents, std::string const& source,
    Options const& options, HttpClientFactory client_factory) {
  auto type = CredentialsFileType(contents, source);
  if (!type) return std::move(type).status();
  if (*type == "service_account") {
    // gcloud may create key files without a "token_uri".
    auto info = ParseServiceAccountKey(contents, source, kDefaultTokenUri);
    if (!info) return std::move(info).status();
    auto project_id = ProjectId(info->project_id);
    return LoadProviderResult{
        std::make_shared<ServiceAccountProvider>(*std::move(info), options,
                                                 std::move(client_factory)),
        std::move(project_id),
        {}};
  }
  if (*type == "authorized_user") {
    return LoadAuthorizedUser(contents, source, options,
                              std::move(client_factory));
  }
  if (*type == "impersonated_service_account") {
    return LoadImpersonated(contents, source, options,
                            std::move(client_factory));
  }
  return CredentialShapeError(
      "Unsupported credential type (" + *type +
          ") when reading Application Default Credentials file from " +
          source + ".",
      GCP_AUTH_ERROR_INFO());
}

ProbeOutcome TryLoadApplicationDefault(CompletionQueue& cq,
                                       Options const& options,
                                       HttpClientFactory client_factory) {
  // 1) The file named by GOOGLE_APPLICATION_CREDENTIALS, it must be usable
  // if the variable is set.
  auto path = AdcFilePathFromEnvVarOrEmpty();
  if (path.empty()) {
    // 2) The file created by `gcloud auth application-default login`.
    path = AdcFilePathFromWellKnownPathOrEmpty();
    if (!path.empty() && !FileExists(path)) path.clear();
  }
  if (!path.empty()) {
    auto contents = ReadCredentialsFile(path);
    if (!contents) return std::move(contents).status();
    auto r = LoadCredentialsFile(*contents, path, options,
                                 std::move(client_factory));
    if (!r) return std::move(r).status();
    return absl::make_optional(Wrap(*std::move(r)));
  }

  // 3) The metadata server.
  GCP_AUTH_LOG(DEBUG) << "no application default credentials file found,"
                      << " trying the metadata server";
  auto r = TryLoadMetadataServer(cq, options, std::move(client_factory));
  if (!r || !r->has_value()) return r;
  return absl::make_optional(Wrap(**std::move(r)));
}

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
