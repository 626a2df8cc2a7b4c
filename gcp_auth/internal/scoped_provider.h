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

#ifndef GCP_AUTH_INTERNAL_SCOPED_PROVIDER_H
#define GCP_AUTH_INTERNAL_SCOPED_PROVIDER_H

#include "gcp_auth/scopes.h"
#include "gcp_auth/token_provider.h"
#include "gcp_auth/version.h"
#include <memory>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

/**
 * Calls a provider with a fixed set of scopes.
 *
 * The scopes passed to `AsyncGetToken()` are ignored.
 */
class ScopedProvider : public TokenProvider {
 public:
  ScopedProvider(std::shared_ptr<TokenProvider> inner, Scopes scopes)
      : inner_(std::move(inner)), scopes_(std::move(scopes)) {}

  future<StatusOr<Token>> AsyncGetToken(CompletionQueue& cq,
                                        Scopes const&) override {
    return inner_->AsyncGetToken(cq, scopes_);
  }
  ProviderKind kind() const override { return ProviderKind::kScoped; }
  std::string name() const override;
  bool requires_scopes() const override { return false; }

  Scopes const& scopes() const { return scopes_; }
  std::shared_ptr<TokenProvider> const& inner() const { return inner_; }

  std::shared_ptr<ScopedProvider> WithNewScopes(Scopes scopes) const {
    return std::make_shared<ScopedProvider>(inner_, std::move(scopes));
  }

 private:
  std::shared_ptr<TokenProvider> inner_;
  Scopes scopes_;
};

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_SCOPED_PROVIDER_H
