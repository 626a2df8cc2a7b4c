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

#include "gcp_auth/internal/auth_service.h"
#include "gcp_auth/internal/make_auth_error.h"
#include "gcp_auth/log.h"
#include "absl/types/variant.h"

namespace gcp_auth {
namespace rest_internal {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace {

using ResponseType = StatusOr<std::unique_ptr<RestResponse>>;

future<ResponseType> Call(std::shared_ptr<HttpService> const& child,
                          Auth const& auth, CompletionQueue& cq,
                          HttpMethod method, RestRequest request,
                          std::string payload, AuthHeader const& header) {
  request.SetHeader("authorization", header.value);
  return child->AsyncCall(cq, method, std::move(request), std::move(payload))
      .then([auth](future<ResponseType> f) {
        auto response = f.get();
        if (!response) return response;
        auto const code = (*response)->StatusCode();
        if (code == HttpStatusCode::kUnauthorized ||
            code == HttpStatusCode::kForbidden) {
          GCP_AUTH_LOG(DEBUG) << "revoking token from "
                              << auth.provider_name() << " after HTTP "
                              << code << " response";
          auth.Revoke(/*start_new=*/true);
        }
        return response;
      });
}

}  // namespace

future<ResponseType> AuthService::AsyncCall(CompletionQueue& cq,
                                            HttpMethod method,
                                            RestRequest request,
                                            std::string payload) {
  auto header = auth_.GetHeader();
  if (auto const* h = absl::get_if<AuthHeader>(&header)) {
    return Call(child_, auth_, cq, method, std::move(request),
                std::move(payload), *h);
  }
  auto refresh = absl::get<future<StatusOr<AuthHeader>>>(std::move(header));
  return refresh.then(
      [child = child_, auth = auth_, cq, method, request = std::move(request),
       payload = std::move(payload)](
          future<StatusOr<AuthHeader>> f) mutable -> future<ResponseType> {
        auto h = f.get();
        if (!h) {
          return make_ready_future(
              ResponseType(internal::AsAuthError(std::move(h).status())));
        }
        return Call(child, auth, cq, method, std::move(request),
                    std::move(payload), *h);
      });
}

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace rest_internal
}  // namespace gcp_auth
