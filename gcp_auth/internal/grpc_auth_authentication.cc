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

#include "gcp_auth/internal/grpc_auth_authentication.h"
#include "gcp_auth/internal/make_auth_error.h"
#include "absl/strings/strip.h"
#include "absl/types/variant.h"

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {
namespace {

void SetCredentials(grpc::ClientContext& context, AuthHeader const& header) {
  auto token = absl::StripPrefix(header.value, "Bearer ");
  context.set_credentials(
      grpc::AccessTokenCredentials(std::string(token.data(), token.size())));
}

}  // namespace

std::shared_ptr<grpc::Channel> GrpcAuthAuthentication::CreateChannel(
    std::string const& endpoint, grpc::ChannelArguments const& arguments) {
  return grpc::CreateCustomChannel(
      endpoint, grpc::SslCredentials(grpc::SslCredentialsOptions{}), arguments);
}

Status GrpcAuthAuthentication::ConfigureContext(grpc::ClientContext& context) {
  auto header = auth_.WaitForHeader();
  if (!header) return AsAuthError(std::move(header).status());
  SetCredentials(context, *header);
  return Status{};
}

future<StatusOr<std::shared_ptr<grpc::ClientContext>>>
GrpcAuthAuthentication::AsyncConfigureContext(
    std::shared_ptr<grpc::ClientContext> context) {
  using ReturnType = StatusOr<std::shared_ptr<grpc::ClientContext>>;
  auto header = auth_.GetHeader();
  if (auto const* h = absl::get_if<AuthHeader>(&header)) {
    SetCredentials(*context, *h);
    return make_ready_future(ReturnType(std::move(context)));
  }
  auto refresh = absl::get<future<StatusOr<AuthHeader>>>(std::move(header));
  return refresh.then([context = std::move(context)](
                          future<StatusOr<AuthHeader>> f) -> ReturnType {
    auto h = f.get();
    if (!h) return AsAuthError(std::move(h).status());
    SetCredentials(*context, *h);
    return context;
  });
}

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
