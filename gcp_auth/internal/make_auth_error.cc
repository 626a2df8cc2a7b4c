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

#include "gcp_auth/internal/make_auth_error.h"
#include "gcp_auth/internal/rest_parse_json_error.h"
#include "gcp_auth/internal/rest_response.h"

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {
namespace {

Status MakeAuthError(AuthErrorKind kind, StatusCode code, std::string msg,
                     ErrorInfoBuilder b) {
  return MakeStatus(
      code, std::move(msg),
      std::move(b).WithDomain(kAuthErrorDomain).WithReason(
          AuthErrorKindName(kind)));
}

Status FatalAuthError(AuthErrorKind kind, StatusCode code, std::string msg,
                      ErrorInfoBuilder b) {
  return MakeAuthError(kind, code, std::move(msg),
                       std::move(b).WithMetadata(kFatalKey, "true"));
}

bool HasMetadata(Status const& status, char const* key,
                 std::string const& value) {
  auto const& m = status.error_info().metadata();
  auto i = m.find(key);
  return i != m.end() && i->second == value;
}

Status WithMetadata(Status const& status, std::string const& key,
                    std::string value) {
  auto info = status.error_info();
  AddMetadata(info, key, std::move(value));
  return Status(status.code(), status.message(), std::move(info));
}

// Keeps the code, message and metadata of @p status in a new domain.
Status Reclassify(Status const& status, AuthErrorKind kind, bool fatal) {
  auto metadata = status.error_info().metadata();
  if (fatal) metadata[kFatalKey] = "true";
  return Status(status.code(), status.message(),
                ErrorInfo(AuthErrorKindName(kind), kAuthErrorDomain,
                          std::move(metadata)));
}

}  // namespace

Status CredentialShapeError(std::string msg, ErrorInfoBuilder b) {
  return FatalAuthError(AuthErrorKind::kCredentialShape,
                        StatusCode::kInvalidArgument, std::move(msg),
                        std::move(b));
}

Status CryptoError(std::string msg, ErrorInfoBuilder b) {
  return FatalAuthError(AuthErrorKind::kCrypto, StatusCode::kInvalidArgument,
                        std::move(msg), std::move(b));
}

Status TransportError(std::string msg, ErrorInfoBuilder b) {
  return MakeAuthError(AuthErrorKind::kTransport, StatusCode::kUnavailable,
                       std::move(msg), std::move(b));
}

Status TransportError(Status const& cause, std::string const& uri,
                      ErrorInfoBuilder b) {
  auto const code = cause.code() == StatusCode::kOk ? StatusCode::kUnavailable
                                                    : cause.code();
  return MakeAuthError(
      AuthErrorKind::kTransport, code, uri + " - " + cause.message(),
      std::move(b)
          .WithMetadata(kUriKey, uri)
          .WithMetadata(kConnectErrorKey,
                        IsConnectError(cause) ? "true" : "false"));
}

Status TokenEndpointError(std::string const& uri,
                          std::int32_t http_status_code, std::string payload,
                          ErrorInfoBuilder b) {
  auto const code = rest_internal::MapHttpCodeToStatus(http_status_code);
  auto msg = rest_internal::FormatHttpError(uri, http_status_code,
                                            std::move(payload));
  auto builder =
      std::move(b)
          .WithMetadata(kUriKey, uri)
          .WithMetadata(kHttpStatusCodeKey, std::to_string(http_status_code));
  auto const is_client_error =
      rest_internal::IsClientErrorCode(http_status_code);
  auto const is_retryable =
      http_status_code == rest_internal::kRequestTimeout ||
      http_status_code == rest_internal::kTooManyRequests;
  // A 2xx response is never an error, report it as unknown.
  auto const status_code = code == StatusCode::kOk ? StatusCode::kUnknown : code;
  if (is_client_error && !is_retryable) {
    return FatalAuthError(AuthErrorKind::kTokenEndpoint, status_code,
                          std::move(msg), std::move(builder));
  }
  return MakeAuthError(AuthErrorKind::kTokenEndpoint, status_code,
                       std::move(msg), std::move(builder));
}

Status BadResponseError(std::string msg, ErrorInfoBuilder b) {
  return FatalAuthError(AuthErrorKind::kBadResponse, StatusCode::kInternal,
                        std::move(msg), std::move(b));
}

Status SubprocessError(std::string msg, ErrorInfoBuilder b) {
  return MakeAuthError(AuthErrorKind::kSubprocess, StatusCode::kUnavailable,
                       std::move(msg), std::move(b));
}

Status RevokedError(std::string msg, ErrorInfoBuilder b) {
  return MakeAuthError(AuthErrorKind::kRevoked, StatusCode::kUnauthenticated,
                       std::move(msg), std::move(b));
}

Status InvalidTokenShapeError(std::string msg, ErrorInfoBuilder b) {
  return FatalAuthError(AuthErrorKind::kInvalidTokenShape,
                        StatusCode::kInvalidArgument, std::move(msg),
                        std::move(b));
}

Status NoProviderFoundError(std::string msg, ErrorInfoBuilder b) {
  return MakeAuthError(AuthErrorKind::kNoProviderFound, StatusCode::kNotFound,
                       std::move(msg), std::move(b));
}

Status MakeFatal(Status status) {
  if (status.ok() || IsFatal(status)) return status;
  return WithMetadata(status, kFatalKey, "true");
}

bool IsFatal(Status const& status) {
  return HasMetadata(status, kFatalKey, "true");
}

bool IsConnectError(Status const& status) {
  return HasMetadata(status, kConnectErrorKey, "true");
}

Status WithProvider(Status status, std::string const& provider) {
  if (status.ok()) return status;
  auto const& m = status.error_info().metadata();
  if (m.find(kProviderKey) != m.end()) return status;
  return WithMetadata(status, kProviderKey, provider);
}

Status AsAuthError(Status status) {
  if (status.ok() || IsAuthError(status)) return status;
  switch (status.code()) {
    case StatusCode::kUnavailable:
    case StatusCode::kDeadlineExceeded:
      return Reclassify(status, AuthErrorKind::kTransport, false);
    case StatusCode::kCancelled:
      return Reclassify(status, AuthErrorKind::kRevoked, false);
    default:
      break;
  }
  return Reclassify(status, AuthErrorKind::kBadResponse, true);
}

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
