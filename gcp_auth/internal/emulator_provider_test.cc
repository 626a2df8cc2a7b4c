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
#include "gcp_auth/testing_util/scoped_environment.h"
#include "gcp_auth/testing_util/status_matchers.h"
#include <gmock/gmock.h>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {
namespace {

using ::gcp_auth::testing_util::ScopedEnvironment;

Options TestOptions() {
  return Options{}
      .set<EmulatorHostEnvVarsOption>(
          {"GCP_AUTH_TEST_EMULATOR_A", "GCP_AUTH_TEST_EMULATOR_B"})
      .set<EmulatorProjectIdOption>("emulator-project");
}

TEST(EmulatorProvider, ConstantToken) {
  auto const now = std::chrono::system_clock::from_time_t(1700000000);
  EmulatorProvider provider([now] { return now; });
  EXPECT_EQ(provider.kind(), ProviderKind::kEmulator);
  EXPECT_EQ(provider.name(), "emulator");
  CompletionQueue cq;
  auto f = provider.AsyncGetToken(cq, Scopes{scopes::kPubSub});
  EXPECT_TRUE(f.is_ready());
  auto token = f.get();
  ASSERT_STATUS_OK(token);
  EXPECT_EQ(token->authorization_header(), "Bearer owner");
  EXPECT_TRUE(token->IsValid(now + std::chrono::hours(24 * 365)));
}

TEST(TryLoadEmulator, NotDetected) {
  ScopedEnvironment a("GCP_AUTH_TEST_EMULATOR_A", absl::nullopt);
  ScopedEnvironment b("GCP_AUTH_TEST_EMULATOR_B", absl::nullopt);
  EXPECT_FALSE(TryLoadEmulator(TestOptions()).has_value());
}

TEST(TryLoadEmulator, DetectedWithDefaultProject) {
  ScopedEnvironment a("GCP_AUTH_TEST_EMULATOR_A", absl::nullopt);
  ScopedEnvironment b("GCP_AUTH_TEST_EMULATOR_B", "localhost:8085");
  ScopedEnvironment project("GOOGLE_CLOUD_PROJECT", absl::nullopt);
  auto r = TryLoadEmulator(TestOptions());
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->provider->kind(), ProviderKind::kEmulator);
  EXPECT_EQ(r->project_id.value(), "emulator-project");
  EXPECT_FALSE(r->token.valid());
}

TEST(TryLoadEmulator, ProjectFromEnvironment) {
  ScopedEnvironment a("GCP_AUTH_TEST_EMULATOR_A", "localhost:9000");
  ScopedEnvironment project("GOOGLE_CLOUD_PROJECT", "env-project");
  auto r = TryLoadEmulator(TestOptions());
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->project_id.value(), "env-project");
}

}  // namespace
}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
