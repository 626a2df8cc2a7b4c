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

#include "gcp_auth/auth_options.h"
#include "gcp_auth/internal/background_threads_impl.h"
#include "gcp_auth/internal/getenv.h"
#include "absl/memory/memory.h"

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {
namespace {

auto constexpr kDefaultMetadataHost = "metadata.google.internal";
auto constexpr kDefaultEmulatorProjectId = "emulator-project";
auto constexpr kDefaultMaxRetries = 5;
auto constexpr kDefaultInitialBackoff = std::chrono::milliseconds(100);
auto constexpr kDefaultMaximumBackoff = std::chrono::seconds(10);
// Token fetches block a thread for the duration of the HTTP request or the
// gcloud subprocess, use more than one thread so timers are not starved.
auto constexpr kDefaultBackgroundThreadPoolSize = 4;

std::vector<std::string> DefaultEmulatorHostEnvVars() {
  return {
      "FIRESTORE_EMULATOR_HOST", "PUBSUB_EMULATOR_HOST",
      "SPANNER_EMULATOR_HOST",   "STORAGE_EMULATOR_HOST",
      "BIGTABLE_EMULATOR_HOST",  "DATASTORE_EMULATOR_HOST",
      "CLOUD_TASKS_EMULATOR_HOST",
  };
}

}  // namespace

std::string DefaultUserAgentProduct() {
  return "gcp-auth-cpp/" + version_string();
}

void CheckAuthOptions(Options const& opts, char const* caller) {
  CheckExpectedOptions<ScopesOption, MetadataHostOption, GCloudExecutableOption,
                       EmulatorHostEnvVarsOption, EmulatorProjectIdOption,
                       RefreshMaxRetriesOption, RefreshInitialBackoffOption,
                       RefreshMaximumBackoffOption, CompletionQueueOption,
                       BackgroundThreadPoolSizeOption,
                       BackgroundThreadsFactoryOption, HttpTimeoutOption,
                       UserAgentProductOption>(opts, caller);
}

Options PopulateAuthOptions(Options opts) {
  if (!opts.has<MetadataHostOption>()) {
    opts.set<MetadataHostOption>(
        GetEnv("GCE_METADATA_HOST").value_or(kDefaultMetadataHost));
  }
  if (!opts.has<EmulatorHostEnvVarsOption>()) {
    opts.set<EmulatorHostEnvVarsOption>(DefaultEmulatorHostEnvVars());
  }
  if (!opts.has<EmulatorProjectIdOption>()) {
    opts.set<EmulatorProjectIdOption>(kDefaultEmulatorProjectId);
  }
  if (!opts.has<RefreshMaxRetriesOption>()) {
    opts.set<RefreshMaxRetriesOption>(kDefaultMaxRetries);
  }
  if (!opts.has<RefreshInitialBackoffOption>()) {
    opts.set<RefreshInitialBackoffOption>(kDefaultInitialBackoff);
  }
  if (!opts.has<RefreshMaximumBackoffOption>()) {
    opts.set<RefreshMaximumBackoffOption>(kDefaultMaximumBackoff);
  }
  if (!opts.has<BackgroundThreadPoolSizeOption>()) {
    opts.set<BackgroundThreadPoolSizeOption>(kDefaultBackgroundThreadPoolSize);
  }
  if (!opts.has<HttpTimeoutOption>()) {
    opts.set<HttpTimeoutOption>(std::chrono::milliseconds(0));
  }
  if (!opts.has<UserAgentProductOption>()) {
    opts.set<UserAgentProductOption>(DefaultUserAgentProduct());
  }
  return opts;
}

BackgroundThreadsFactory MakeBackgroundThreadsFactory(Options const& opts) {
  if (opts.has<CompletionQueueOption>()) {
    auto const& cq = opts.get<CompletionQueueOption>();
    return [cq]() -> std::unique_ptr<BackgroundThreads> {
      return absl::make_unique<CustomerSuppliedBackgroundThreads>(cq);
    };
  }
  if (opts.has<BackgroundThreadsFactoryOption>()) {
    return opts.get<BackgroundThreadsFactoryOption>();
  }
  auto const s = opts.has<BackgroundThreadPoolSizeOption>()
                     ? opts.get<BackgroundThreadPoolSizeOption>()
                     : std::size_t{kDefaultBackgroundThreadPoolSize};
  return [s]() -> std::unique_ptr<BackgroundThreads> {
    return absl::make_unique<AutomaticallyCreatedBackgroundThreads>(s);
  };
}

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
