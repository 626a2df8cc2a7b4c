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

#ifndef GCP_AUTH_AUTH_OPTIONS_H
#define GCP_AUTH_AUTH_OPTIONS_H

#include "gcp_auth/background_threads.h"
#include "gcp_auth/completion_queue.h"
#include "gcp_auth/options.h"
#include "gcp_auth/version.h"
#include <chrono>
#include <string>
#include <vector>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN

/**
 * The OAuth2 scopes requested for providers that need them.
 *
 * If unset, or empty, the
 * `https://www.googleapis.com/auth/cloud-platform` scope is used.
 */
struct ScopesOption {
  using Type = std::vector<std::string>;
};

/**
 * The host (and optional port) of the GCE metadata server.
 *
 * Defaults to the value of `GCE_METADATA_HOST` or, if that is not set,
 * `metadata.google.internal`.
 */
struct MetadataHostOption {
  using Type = std::string;
};

/**
 * Path to the `gcloud` executable.
 *
 * If unset, `gcloud` is searched for in the directories listed in `PATH`.
 */
struct GCloudExecutableOption {
  using Type = std::string;
};

/**
 * Environment variables that select the emulator provider when set.
 *
 * The default covers the emulators for Firestore, Pub/Sub, Spanner, Storage,
 * Bigtable, Datastore, and Cloud Tasks.
 */
struct EmulatorHostEnvVarsOption {
  using Type = std::vector<std::string>;
};

/// The project id reported by the emulator provider, unless
/// `GOOGLE_CLOUD_PROJECT` is set.
struct EmulatorProjectIdOption {
  using Type = std::string;
};

/// Maximum number of retries after the first failed token fetch.
struct RefreshMaxRetriesOption {
  using Type = int;
};

/// The initial backoff delay between token fetch attempts.
struct RefreshInitialBackoffOption {
  using Type = std::chrono::milliseconds;
};

/// The maximum backoff delay between token fetch attempts.
struct RefreshMaximumBackoffOption {
  using Type = std::chrono::milliseconds;
};

/**
 * Use the provided `CompletionQueue` for background work.
 *
 * The application is responsible for running the event loop. This option
 * takes precedence over `BackgroundThreadsFactoryOption` and
 * `BackgroundThreadPoolSizeOption`.
 */
struct CompletionQueueOption {
  using Type = CompletionQueue;
};

/// The number of threads created to run the background `CompletionQueue`.
struct BackgroundThreadPoolSizeOption {
  using Type = std::size_t;
};

/// Changes the `BackgroundThreadsFactory`.
struct BackgroundThreadsFactoryOption {
  using Type = BackgroundThreadsFactory;
};

/**
 * The maximum time for a single HTTP transfer to a token endpoint.
 *
 * A zero value, the default, disables the timeout.
 */
struct HttpTimeoutOption {
  using Type = std::chrono::milliseconds;
};

/// The `user-agent` product sent with each token request.
struct UserAgentProductOption {
  using Type = std::string;
};

namespace internal {

/// The default `user-agent` product, `gcp-auth-cpp/<version>`.
std::string DefaultUserAgentProduct();

/// Logs a warning for each option in @p opts not used by this library.
void CheckAuthOptions(Options const& opts, char const* caller);

/// Fills in any unset authentication option with its default value.
Options PopulateAuthOptions(Options opts);

/// Returns the factory selected by the background thread options.
BackgroundThreadsFactory MakeBackgroundThreadsFactory(Options const& opts);

}  // namespace internal

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_AUTH_OPTIONS_H
