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

#include "gcp_auth/auth_error.h"
#include "gcp_auth/internal/make_auth_error.h"
#include <array>
#include <iostream>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace {

std::array<AuthErrorKind, 9> constexpr kAllKinds = {
    AuthErrorKind::kNoProviderFound, AuthErrorKind::kCredentialShape,
    AuthErrorKind::kCrypto,          AuthErrorKind::kTransport,
    AuthErrorKind::kTokenEndpoint,   AuthErrorKind::kBadResponse,
    AuthErrorKind::kSubprocess,      AuthErrorKind::kRevoked,
    AuthErrorKind::kInvalidTokenShape,
};

}  // namespace

std::string AuthErrorKindName(AuthErrorKind kind) {
  switch (kind) {
    case AuthErrorKind::kNoProviderFound:
      return "NO_PROVIDER_FOUND";
    case AuthErrorKind::kCredentialShape:
      return "CREDENTIAL_SHAPE";
    case AuthErrorKind::kCrypto:
      return "CRYPTO";
    case AuthErrorKind::kTransport:
      return "TRANSPORT";
    case AuthErrorKind::kTokenEndpoint:
      return "TOKEN_ENDPOINT";
    case AuthErrorKind::kBadResponse:
      return "BAD_RESPONSE";
    case AuthErrorKind::kSubprocess:
      return "SUBPROCESS";
    case AuthErrorKind::kRevoked:
      return "REVOKED";
    case AuthErrorKind::kInvalidTokenShape:
      return "INVALID_TOKEN_SHAPE";
  }
  return "UNEXPECTED_AUTH_ERROR_KIND";
}

std::ostream& operator<<(std::ostream& os, AuthErrorKind kind) {
  return os << AuthErrorKindName(kind);
}

absl::optional<AuthErrorKind> GetAuthErrorKind(Status const& status) {
  if (status.ok()) return absl::nullopt;
  auto const& info = status.error_info();
  if (info.domain() != kAuthErrorDomain) return absl::nullopt;
  for (auto k : kAllKinds) {
    if (info.reason() == AuthErrorKindName(k)) return k;
  }
  return absl::nullopt;
}

bool IsFatalAuthError(Status const& status) {
  return IsAuthError(status) && internal::IsFatal(status);
}

std::string ProviderName(Status const& status) {
  auto const& m = status.error_info().metadata();
  auto i = m.find(internal::kProviderKey);
  if (i == m.end()) return {};
  return i->second;
}

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
