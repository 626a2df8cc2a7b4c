// Copyright 2018 Google LLC
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

#ifndef GCP_AUTH_INTERNAL_BACKOFF_POLICY_H
#define GCP_AUTH_INTERNAL_BACKOFF_POLICY_H

#include "gcp_auth/version.h"
#include "absl/types/optional.h"
#include <chrono>
#include <memory>
#include <random>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

/// Computes the delay before each retry of a failed token fetch.
class BackoffPolicy {
 public:
  virtual ~BackoffPolicy() = default;

  /// A policy with the same parameters, starting from the first delay.
  virtual std::unique_ptr<BackoffPolicy> clone() const = 0;

  virtual std::chrono::milliseconds OnCompletion() = 0;
};

/**
 * Exponential backoff with jitter.
 *
 * The first delay is @p initial_delay. Each later delay is drawn uniformly
 * from `[initial_delay, upper]`, where `upper` grows by @p scaling after each
 * call and never exceeds @p maximum_delay.
 *
 * @throws std::invalid_argument if `scaling <= 1.0` or
 *     `maximum_delay < initial_delay`.
 */
class ExponentialBackoffPolicy : public BackoffPolicy {
 public:
  ExponentialBackoffPolicy(std::chrono::milliseconds initial_delay,
                           std::chrono::milliseconds maximum_delay,
                           double scaling = 2.0);

  std::unique_ptr<BackoffPolicy> clone() const override;
  std::chrono::milliseconds OnCompletion() override;

 private:
  using Millis = std::chrono::duration<double, std::milli>;

  Millis initial_delay_;
  Millis maximum_delay_;
  double scaling_;
  Millis upper_;
  // Created on the first jittered delay, most fetches never retry.
  absl::optional<std::mt19937_64> generator_;
};

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_BACKOFF_POLICY_H
