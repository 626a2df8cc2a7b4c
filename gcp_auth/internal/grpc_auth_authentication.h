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

#ifndef GCP_AUTH_INTERNAL_GRPC_AUTH_AUTHENTICATION_H
#define GCP_AUTH_INTERNAL_GRPC_AUTH_AUTHENTICATION_H

#include "gcp_auth/auth.h"
#include "gcp_auth/future.h"
#include "gcp_auth/status.h"
#include "gcp_auth/status_or.h"
#include "gcp_auth/version.h"
#include <grpcpp/grpcpp.h>
#include <memory>
#include <string>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

/**
 * Configures gRPC calls with the token cached by an `Auth` handle.
 *
 * Each call gets `grpc::AccessTokenCredentials` for the current token, so
 * calls started after a refresh use the new token.
 */
class GrpcAuthAuthentication {
 public:
  explicit GrpcAuthAuthentication(Auth auth) : auth_(std::move(auth)) {}

  /// Creates a TLS channel to @p endpoint.
  std::shared_ptr<grpc::Channel> CreateChannel(
      std::string const& endpoint, grpc::ChannelArguments const& arguments);

  /// Blocks until a valid token is available and sets the call credentials.
  Status ConfigureContext(grpc::ClientContext& context);

  future<StatusOr<std::shared_ptr<grpc::ClientContext>>> AsyncConfigureContext(
      std::shared_ptr<grpc::ClientContext> context);

 private:
  Auth auth_;
};

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_GRPC_AUTH_AUTHENTICATION_H
