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

#include "gcp_auth/auth.h"
#include "gcp_auth/auth_options.h"
#include "gcp_auth/internal/auth_impl.h"
#include "absl/types/variant.h"

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace {

struct WaitVisitor {
  StatusOr<AuthHeader> operator()(AuthHeader& h) { return std::move(h); }
  StatusOr<AuthHeader> operator()(future<StatusOr<AuthHeader>>& f) {
    return f.get();
  }
};

}  // namespace

HeaderResult Auth::GetHeader() const { return impl_->GetHeader(); }

StatusOr<AuthHeader> Auth::WaitForHeader() const {
  auto h = impl_->GetHeader();
  return absl::visit(WaitVisitor{}, h);
}

void Auth::Revoke(bool start_new) const { impl_->Revoke(start_new); }

Auth Auth::WithScopes(Scopes scopes) const {
  return Auth(impl_->WithScopes(std::move(scopes)));
}

ProjectId const& Auth::project_id() const { return impl_->project_id(); }

ProviderKind Auth::provider_kind() const { return impl_->kind(); }

std::string const& Auth::provider_name() const { return impl_->name(); }

Scopes const& Auth::scopes() const { return impl_->scopes(); }

StatusOr<Auth> MakeAuth(Options opts) {
  return internal::MakeAuth(std::move(opts),
                            internal::MakeDefaultHttpClientFactory());
}

StatusOr<Auth> MakeServiceAccountAuth(std::string const& json_object,
                                      Options opts) {
  return internal::MakeServiceAccountAuth(
      json_object, std::move(opts), internal::MakeDefaultHttpClientFactory());
}

Auth MakeAuthFromProvider(std::shared_ptr<TokenProvider> provider,
                          ProjectId project_id, Options opts) {
  internal::CheckAuthOptions(opts, __func__);
  opts = internal::PopulateAuthOptions(std::move(opts));
  std::shared_ptr<BackgroundThreads> background =
      internal::MakeBackgroundThreadsFactory(opts)();
  Scopes scopes(opts.lookup<ScopesOption>());
  return internal::MakeAuthFromImpl(std::make_shared<internal::AuthImpl>(
      std::move(background),
      internal::LoadProviderResult{std::move(provider), std::move(project_id),
                                   {}},
      std::move(scopes), opts));
}

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
