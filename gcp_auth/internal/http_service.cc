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

#include "gcp_auth/internal/http_service.h"
#include "gcp_auth/internal/async_blocking.h"
#include "absl/types/span.h"
#include <ostream>
#include <vector>

namespace gcp_auth {
namespace rest_internal {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace {

class RestClientService : public HttpService {
 public:
  explicit RestClientService(std::shared_ptr<RestClient> client)
      : client_(std::move(client)) {}

  future<StatusOr<std::unique_ptr<RestResponse>>> AsyncCall(
      CompletionQueue& cq, HttpMethod method, RestRequest request,
      std::string payload) override {
    auto client = client_;
    return internal::AsyncRunBlocking<std::unique_ptr<RestResponse>>(
        cq, [client, method, request = std::move(request),
             payload = std::move(payload)]() {
          if (method == HttpMethod::kGet) return client->Get(request);
          return client->Post(request, std::vector<absl::Span<char const>>{
                                           absl::MakeConstSpan(payload)});
        });
  }

 private:
  std::shared_ptr<RestClient> client_;
};

}  // namespace

std::ostream& operator<<(std::ostream& os, HttpMethod method) {
  switch (method) {
    case HttpMethod::kGet:
      return os << "GET";
    case HttpMethod::kPost:
      return os << "POST";
  }
  return os << "UNKNOWN";
}

std::shared_ptr<HttpService> MakeRestClientService(
    std::shared_ptr<RestClient> client) {
  return std::make_shared<RestClientService>(std::move(client));
}

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace rest_internal
}  // namespace gcp_auth
