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

#ifndef GCP_AUTH_INTERNAL_HTTP_CLIENT_FACTORY_H
#define GCP_AUTH_INTERNAL_HTTP_CLIENT_FACTORY_H

#include "gcp_auth/internal/rest_client.h"
#include "gcp_auth/options.h"
#include "gcp_auth/version.h"
#include <functional>
#include <memory>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

/**
 * Create a HTTP client.
 *
 * Providers contact token endpoints at most once per token lifetime, often
 * once an hour. Keeping a `RestClient` does not provide any benefits, as the
 * underlying connections will be closed by the time a new request is made.
 * Tests use the factory to inject mocks.
 */
using HttpClientFactory =
    std::function<std::unique_ptr<rest_internal::RestClient>(Options const&)>;

/// Returns a factory creating clients with `rest_internal::MakeDefaultRestClient`.
HttpClientFactory MakeDefaultHttpClientFactory();

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_HTTP_CLIENT_FACTORY_H
