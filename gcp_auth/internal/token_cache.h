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

#ifndef GCP_AUTH_INTERNAL_TOKEN_CACHE_H
#define GCP_AUTH_INTERNAL_TOKEN_CACHE_H

#include "gcp_auth/auth_header.h"
#include "gcp_auth/completion_queue.h"
#include "gcp_auth/internal/refresh_driver.h"
#include "gcp_auth/status_or.h"
#include "gcp_auth/token.h"
#include "gcp_auth/version.h"
#include "absl/types/optional.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

/**
 * Caches a token shared by all the users of an `Auth` handle.
 *
 * At most one refresh is in flight at any time. All the callers that find the
 * cache empty or expired wait for the same refresh, and receive the same
 * result. Errors are delivered to the waiters of the refresh that produced
 * them, they are not cached.
 *
 * When a refresh completes the cache is updated before any waiter is notified.
 * Waiters are notified in the threads running the completion queue, never
 * while holding the cache's lock.
 *
 * Destroying the cache cancels any refresh in progress, and satisfies all the
 * waiters with a `kCancelled` error.
 */
class TokenCache : public std::enable_shared_from_this<TokenCache> {
 public:
  using CurrentTimeFn =
      std::function<std::chrono::system_clock::time_point()>;

  static std::shared_ptr<TokenCache> Create(
      CompletionQueue cq, AsyncTokenSource source,
      CurrentTimeFn current_time_fn = std::chrono::system_clock::now);

  ~TokenCache();

  /// Returns the cached header, or a future for the next refresh.
  HeaderResult GetValid() { return GetValid(current_time_fn_()); }
  HeaderResult GetValid(std::chrono::system_clock::time_point now);

  /**
   * Discards the cached token.
   *
   * If @p start_new is true, and no refresh is in progress, a refresh starts
   * immediately.
   */
  void Revoke(bool start_new);

  /// Uses @p token, a request started elsewhere, as the refresh in progress.
  void AdoptRefresh(future<StatusOr<Token>> token);

  /// True if a refresh is in progress.
  bool refreshing() const;

 private:
  using WaiterType = promise<StatusOr<AuthHeader>>;

  TokenCache(CompletionQueue cq, AsyncTokenSource source,
             CurrentTimeFn current_time_fn);

  void StartRefresh(std::unique_lock<std::mutex> lk);
  void Watch(std::unique_lock<std::mutex> lk, future<StatusOr<Token>> f);
  void OnRefresh(std::uint64_t generation, StatusOr<Token> result);

  std::weak_ptr<TokenCache> WeakFromThis() {
    return std::weak_ptr<TokenCache>(shared_from_this());
  }

  CompletionQueue cq_;
  AsyncTokenSource source_;
  CurrentTimeFn current_time_fn_;
  mutable std::mutex mu_;
  absl::optional<Token> token_;
  bool refreshing_ = false;
  std::uint64_t generation_ = 0;
  future<bool> pending_;
  std::vector<WaiterType> waiting_;
};

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_TOKEN_CACHE_H
