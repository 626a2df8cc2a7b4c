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

#include "gcp_auth/internal/emulator_provider.h"
#include "gcp_auth/auth_options.h"
#include "gcp_auth/internal/getenv.h"
#include "gcp_auth/log.h"

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {
namespace {

auto constexpr kEmulatorTokenLifetime = std::chrono::hours(24 * 365 * 10);

}  // namespace

future<StatusOr<Token>> EmulatorProvider::AsyncGetToken(CompletionQueue&,
                                                        Scopes const&) {
  auto const now = current_time_fn_();
  return make_ready_future(
      Token::Create(kEmulatorAccessToken, now, now + kEmulatorTokenLifetime));
}

absl::optional<LoadProviderResult> TryLoadEmulator(Options const& options) {
  for (auto const& var : options.get<EmulatorHostEnvVarsOption>()) {
    auto value = GetEnv(var.c_str());
    if (!value.has_value()) continue;
    GCP_AUTH_LOG(DEBUG) << "emulator detected, " << var << "=" << *value;
    auto project_id = GetEnv("GOOGLE_CLOUD_PROJECT");
    return LoadProviderResult{
        std::make_shared<EmulatorProvider>(),
        ProjectId(project_id.value_or(options.get<EmulatorProjectIdOption>())),
        {}};
  }
  return absl::nullopt;
}

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
