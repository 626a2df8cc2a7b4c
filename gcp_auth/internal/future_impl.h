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

#ifndef GCP_AUTH_INTERNAL_FUTURE_IMPL_H
#define GCP_AUTH_INTERNAL_FUTURE_IMPL_H

#include "gcp_auth/version.h"
#include "absl/types/optional.h"
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <utility>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
template <typename T>
class future;

namespace internal {

[[noreturn]] void ThrowFutureError(std::future_errc ec);
std::exception_ptr MakeFutureError(std::future_errc ec);

/**
 * State shared between a `promise<T>` and its `future<T>`.
 *
 * Holds the value or the exception once satisfied, plus at most one callback
 * to run when that happens. The callback runs in the satisfying thread,
 * without holding the lock.
 */
template <typename T>
class future_shared_state final {  // NOLINT(readability-identifier-naming)
 public:
  future_shared_state() = default;
  explicit future_shared_state(std::function<void()> on_cancel)
      : on_cancel_(std::move(on_cancel)) {}

  /// Blocks until satisfied, then moves the result out. Only one call
  /// succeeds.
  T get() {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait(lk, [this] { return ready_; });
    if (consumed_) ThrowFutureError(std::future_errc::no_state);
    consumed_ = true;
    if (error_) std::rethrow_exception(error_);
    return std::move(*value_);
  }

  void set_value(T value) {
    std::unique_lock<std::mutex> lk(mu_);
    if (ready_) ThrowFutureError(std::future_errc::promise_already_satisfied);
    value_.emplace(std::move(value));
    MarkReady(std::move(lk));
  }

  void set_exception(std::exception_ptr ex) {
    std::unique_lock<std::mutex> lk(mu_);
    if (ready_) ThrowFutureError(std::future_errc::promise_already_satisfied);
    error_ = std::move(ex);
    MarkReady(std::move(lk));
  }

  // Called by ~promise(): a no-op on satisfied states.
  void abandon() {
    std::unique_lock<std::mutex> lk(mu_);
    if (ready_) return;
    error_ = MakeFutureError(std::future_errc::broken_promise);
    MarkReady(std::move(lk));
  }

  bool is_ready() const {
    std::lock_guard<std::mutex> lk(mu_);
    return ready_;
  }

  void wait() {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait(lk, [this] { return ready_; });
  }

  template <typename Rep, typename Period>
  std::future_status wait_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lk(mu_);
    if (cv_.wait_for(lk, timeout, [this] { return ready_; })) {
      return std::future_status::ready;
    }
    return on_ready_ ? std::future_status::deferred
                     : std::future_status::timeout;
  }

  /// Registers @p callback, running it right away if already satisfied.
  void set_continuation(std::function<void()> callback) {
    std::unique_lock<std::mutex> lk(mu_);
    if (on_ready_) {
      ThrowFutureError(std::future_errc::future_already_retrieved);
    }
    if (!ready_) {
      on_ready_ = std::move(callback);
      return;
    }
    lk.unlock();
    callback();
  }

  /// Hands the cancellation callback over to a downstream state.
  std::function<void()> release_cancellation_callback() {
    std::lock_guard<std::mutex> lk(mu_);
    std::function<void()> cb;
    cb.swap(on_cancel_);
    return cb;
  }

  bool cancel() {
    std::function<void()> cb;
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (ready_ || cancelled_) return false;
      cancelled_ = true;
      cb = on_cancel_;
    }
    if (cb) cb();
    return true;
  }

  /// Fails unless this is the first `get_future()` call for @p state.
  static void mark_retrieved(
      std::shared_ptr<future_shared_state> const& state) {
    if (!state) ThrowFutureError(std::future_errc::no_state);
    std::lock_guard<std::mutex> lk(state->mu_);
    if (state->has_future_) {
      ThrowFutureError(std::future_errc::future_already_retrieved);
    }
    state->has_future_ = true;
  }

 private:
  void MarkReady(std::unique_lock<std::mutex> lk) {
    ready_ = true;
    auto callback = std::move(on_ready_);
    on_ready_ = nullptr;
    lk.unlock();
    cv_.notify_all();
    if (callback) callback();
  }

  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool ready_ = false;
  bool consumed_ = false;
  bool cancelled_ = false;
  bool has_future_ = false;
  absl::optional<T> value_;
  std::exception_ptr error_;
  std::function<void()> on_ready_;
  std::function<void()> on_cancel_;
};

// `future<T>::then(F)` returns `future<UnwrappedType<R>>`, where `R` is the
// type returned by `F`.
template <typename R>
struct Unwrap {
  using type = R;
};
template <typename R>
struct Unwrap<future<R>> {
  using type = typename Unwrap<R>::type;
};
template <typename R>
using UnwrappedType = typename Unwrap<R>::type;

template <typename F, typename... Args>
using invoke_result_t = decltype(std::declval<F>()(std::declval<Args>()...));

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_FUTURE_IMPL_H
