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

#include "gcp_auth/internal/auth_impl.h"
#include "gcp_auth/auth_options.h"
#include "gcp_auth/internal/backoff_policy.h"
#include "gcp_auth/internal/detect_provider.h"
#include "gcp_auth/internal/refresh_driver.h"
#include "gcp_auth/internal/scoped_provider.h"
#include "gcp_auth/internal/service_account_provider.h"
#include "gcp_auth/log.h"

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {
namespace {

AsyncTokenSource MakeTokenSource(std::shared_ptr<TokenProvider> provider,
                                 Scopes scopes, Options const& options) {
  auto const max_retries = options.get<RefreshMaxRetriesOption>();
  auto const policy = ExponentialBackoffPolicy(
      options.get<RefreshInitialBackoffOption>(),
      options.get<RefreshMaximumBackoffOption>());
  auto name = provider->name();
  return [provider = std::move(provider), scopes = std::move(scopes),
          max_retries, policy, name = std::move(name)](CompletionQueue& cq) {
    auto attempt = [provider, scopes](CompletionQueue& cq) {
      return provider->AsyncGetToken(cq, scopes);
    };
    return RetryTokenFetch(cq, std::move(attempt), max_retries,
                           policy.clone(), name);
  };
}

}  // namespace

AuthImpl::AuthImpl(std::shared_ptr<BackgroundThreads> background,
                   LoadProviderResult result, Scopes scopes,
                   Options const& options, CurrentTimeFn current_time_fn)
    : background_(std::move(background)),
      provider_(std::move(result.provider)),
      project_id_(std::move(result.project_id)),
      kind_(provider_->kind()),
      name_(provider_->name()),
      scopes_(std::move(scopes)),
      options_(options),
      current_time_fn_(std::move(current_time_fn)),
      cache_(TokenCache::Create(background_->cq(),
                                MakeTokenSource(provider_, scopes_, options_),
                                current_time_fn_)) {
  if (result.token.valid()) cache_->AdoptRefresh(std::move(result.token));
}

std::shared_ptr<AuthImpl> AuthImpl::WithScopes(Scopes scopes) const {
  auto inner = provider_;
  if (auto const* scoped = dynamic_cast<ScopedProvider const*>(inner.get())) {
    inner = scoped->inner();
  }
  auto provider = std::make_shared<ScopedProvider>(std::move(inner), scopes);
  return std::make_shared<AuthImpl>(
      background_, LoadProviderResult{std::move(provider), project_id_, {}},
      std::move(scopes), options_, current_time_fn_);
}

Auth MakeAuthFromImpl(std::shared_ptr<AuthImpl> impl) {
  return Auth(std::move(impl));
}

StatusOr<Auth> MakeAuth(Options opts, HttpClientFactory client_factory) {
  CheckAuthOptions(opts, __func__);
  opts = PopulateAuthOptions(std::move(opts));
  std::shared_ptr<BackgroundThreads> background =
      MakeBackgroundThreadsFactory(opts)();
  auto result =
      DetectProvider(background->cq(), opts, std::move(client_factory)).get();
  if (!result) return std::move(result).status();
  GCP_AUTH_LOG(INFO) << "using credentials from " << result->provider->name()
                     << " for project " << result->project_id;
  Scopes scopes(opts.lookup<ScopesOption>());
  return MakeAuthFromImpl(std::make_shared<AuthImpl>(
      std::move(background), *std::move(result), std::move(scopes), opts));
}

StatusOr<Auth> MakeServiceAccountAuth(std::string const& json_object,
                                      Options opts,
                                      HttpClientFactory client_factory) {
  auto info = ParseServiceAccountKey(json_object, "memory");
  if (!info) return std::move(info).status();
  CheckAuthOptions(opts, __func__);
  opts = PopulateAuthOptions(std::move(opts));
  std::shared_ptr<BackgroundThreads> background =
      MakeBackgroundThreadsFactory(opts)();
  ProjectId project_id(info->project_id);
  auto provider = std::make_shared<ServiceAccountProvider>(
      *std::move(info), opts, std::move(client_factory));
  Scopes scopes(opts.lookup<ScopesOption>());
  return MakeAuthFromImpl(std::make_shared<AuthImpl>(
      std::move(background),
      LoadProviderResult{std::move(provider), std::move(project_id), {}},
      std::move(scopes), opts));
}

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
