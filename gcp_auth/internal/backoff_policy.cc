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

#include "gcp_auth/internal/backoff_policy.h"
#include "absl/memory/memory.h"
#include <algorithm>
#include <stdexcept>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {
namespace {

std::mt19937_64 MakeGenerator() {
  std::random_device rd;
  std::seed_seq seq{rd(), rd(), rd(), rd()};
  return std::mt19937_64(seq);
}

}  // namespace

ExponentialBackoffPolicy::ExponentialBackoffPolicy(
    std::chrono::milliseconds initial_delay,
    std::chrono::milliseconds maximum_delay, double scaling)
    : initial_delay_(initial_delay),
      maximum_delay_(maximum_delay),
      scaling_(scaling),
      upper_(initial_delay_) {
  if (scaling_ <= 1.0) {
    throw std::invalid_argument("backoff scaling factor must be > 1.0");
  }
  if (maximum_delay < initial_delay) {
    throw std::invalid_argument("maximum backoff must be >= initial backoff");
  }
}

std::unique_ptr<BackoffPolicy> ExponentialBackoffPolicy::clone() const {
  return absl::make_unique<ExponentialBackoffPolicy>(
      std::chrono::duration_cast<std::chrono::milliseconds>(initial_delay_),
      std::chrono::duration_cast<std::chrono::milliseconds>(maximum_delay_),
      scaling_);
}

std::chrono::milliseconds ExponentialBackoffPolicy::OnCompletion() {
  auto const upper = (std::min)(upper_, maximum_delay_);
  upper_ *= scaling_;
  if (upper <= initial_delay_) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        initial_delay_);
  }
  if (!generator_) generator_ = MakeGenerator();
  std::uniform_real_distribution<double> jitter(initial_delay_.count(),
                                                upper.count());
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      Millis(jitter(*generator_)));
}

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
