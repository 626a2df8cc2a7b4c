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

#ifndef GCP_AUTH_INTERNAL_EMULATOR_PROVIDER_H
#define GCP_AUTH_INTERNAL_EMULATOR_PROVIDER_H

#include "gcp_auth/internal/load_provider_result.h"
#include "gcp_auth/options.h"
#include "gcp_auth/token_provider.h"
#include "gcp_auth/version.h"
#include "absl/types/optional.h"
#include <chrono>
#include <functional>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

/// The access token accepted by the GCP emulators.
auto constexpr kEmulatorAccessToken = "owner";

/**
 * Returns a constant token, as expected by the GCP emulators.
 *
 * The token never needs a refresh in practice.
 */
class EmulatorProvider : public TokenProvider {
 public:
  using CurrentTimeFn =
      std::function<std::chrono::system_clock::time_point()>;

  explicit EmulatorProvider(
      CurrentTimeFn current_time_fn = std::chrono::system_clock::now)
      : current_time_fn_(std::move(current_time_fn)) {}

  future<StatusOr<Token>> AsyncGetToken(CompletionQueue& cq,
                                        Scopes const& scopes) override;
  ProviderKind kind() const override { return ProviderKind::kEmulator; }
  std::string name() const override { return "emulator"; }
  bool requires_scopes() const override { return false; }

 private:
  CurrentTimeFn current_time_fn_;
};

/**
 * Uses the emulator provider if any variable in `EmulatorHostEnvVarsOption`
 * is set.
 *
 * The project is the value of `GOOGLE_CLOUD_PROJECT`, or
 * `EmulatorProjectIdOption` if that is not set.
 */
absl::optional<LoadProviderResult> TryLoadEmulator(Options const& options);

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_EMULATOR_PROVIDER_H
