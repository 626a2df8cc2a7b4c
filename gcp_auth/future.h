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

#ifndef GCP_AUTH_FUTURE_H
#define GCP_AUTH_FUTURE_H

#include "gcp_auth/internal/future_impl.h"
#include "gcp_auth/version.h"
#include <memory>
#include <type_traits>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
template <typename T>
class promise;

namespace internal {
struct FutureThenImpl;
}  // namespace internal

/**
 * A `std::future<T>` look-alike that supports `.then()` and `.cancel()`.
 *
 * A continuation runs in the thread that satisfies the future, or in the
 * calling thread if the future is already satisfied when `.then()` is called.
 * Continuations returning `future<U>` are unwrapped, so the result of
 * `.then()` is never a `future<future<U>>`.
 */
template <typename T>
class future final {
 public:
  future() noexcept = default;
  future(future&&) noexcept = default;
  future& operator=(future&&) noexcept = default;
  future(future const&) = delete;
  future& operator=(future const&) = delete;

  /// Unwrapping constructor: satisfied when the inner future is.
  // NOLINTNEXTLINE(google-explicit-constructor)
  future(future<future<T>>&& rhs);

  /// Blocks until satisfied and returns the value, or rethrows the stored
  /// exception. The future is no longer valid afterwards.
  T get() {
    auto state = Release();
    return state->get();
  }

  template <typename F>
  future<internal::UnwrappedType<internal::invoke_result_t<F, future<T>>>> then(
      F&& functor);

  bool valid() const noexcept { return state_ != nullptr; }

  void wait() const { Checked().wait(); }

  template <typename Rep, typename Period>
  std::future_status wait_for(
      std::chrono::duration<Rep, Period> const& timeout) const {
    return Checked().wait_for(timeout);
  }

  bool is_ready() const { return Checked().is_ready(); }

  /// Runs the producer's cancellation callback. Returns false when there is
  /// nothing to cancel.
  bool cancel() { return state_ && state_->cancel(); }

 private:
  using State = internal::future_shared_state<T>;

  friend class promise<T>;
  friend struct internal::FutureThenImpl;

  explicit future(std::shared_ptr<State> state) : state_(std::move(state)) {}

  State& Checked() const {
    if (!state_) internal::ThrowFutureError(std::future_errc::no_state);
    return *state_;
  }

  std::shared_ptr<State> Release() {
    Checked();
    return std::move(state_);
  }

  std::shared_ptr<State> state_;
};

/**
 * Satisfies a `future<T>`.
 *
 * Destroying an unsatisfied promise stores `std::future_errc::broken_promise`
 * in the future.
 */
template <typename T>
class promise final {
 public:
  promise() : state_(std::make_shared<State>()) {}

  /// @p on_cancel runs when the consumer calls `future<T>::cancel()`.
  explicit promise(std::function<void()> on_cancel)
      : state_(std::make_shared<State>(std::move(on_cancel))) {}

  promise(promise&& rhs) noexcept : state_(std::move(rhs.state_)) {}
  promise& operator=(promise&& rhs) noexcept {
    promise tmp(std::move(rhs));
    std::swap(state_, tmp.state_);
    return *this;
  }
  promise(promise const&) = delete;
  promise& operator=(promise const&) = delete;

  ~promise() {
    if (state_) state_->abandon();
  }

  future<T> get_future() {
    State::mark_retrieved(state_);
    return future<T>(state_);
  }

  void set_value(T value) { Checked().set_value(std::move(value)); }

  void set_exception(std::exception_ptr ex) {
    Checked().set_exception(std::move(ex));
  }

 private:
  using State = internal::future_shared_state<T>;

  State& Checked() const {
    if (!state_) internal::ThrowFutureError(std::future_errc::no_state);
    return *state_;
  }

  std::shared_ptr<State> state_;
};

namespace internal {

struct FutureThenImpl {
  template <typename T, typename F>
  static future<UnwrappedType<invoke_result_t<F, future<T>>>> Then(
      future<T>& input, F&& functor) {
    using U = UnwrappedType<invoke_result_t<F, future<T>>>;
    auto in = input.Release();
    auto out = std::make_shared<future_shared_state<U>>(
        in->release_cancellation_callback());
    // std::function needs a copyable target, the functor may be move-only.
    auto fn = std::make_shared<typename std::decay<F>::type>(
        std::forward<F>(functor));
    in->set_continuation([in, out, fn] {
      try {
        Complete(out, (*fn)(future<T>(in)));
      } catch (...) {
        out->set_exception(std::current_exception());
      }
    });
    return future<U>(std::move(out));
  }

  template <typename T>
  static std::shared_ptr<future_shared_state<T>> Flatten(
      future<future<T>>& input) {
    auto in = input.Release();
    auto out = std::make_shared<future_shared_state<T>>(
        in->release_cancellation_callback());
    Forward(out, std::move(in));
    return out;
  }

 private:
  // Satisfies `out` once `in` is satisfied.
  template <typename U, typename V>
  static void Forward(std::shared_ptr<future_shared_state<U>> out,
                      std::shared_ptr<future_shared_state<V>> in) {
    in->set_continuation([in, out] {
      try {
        Complete(out, in->get());
      } catch (...) {
        out->set_exception(std::current_exception());
      }
    });
  }

  template <typename U>
  static void Complete(std::shared_ptr<future_shared_state<U>> const& out,
                       U value) {
    out->set_value(std::move(value));
  }

  template <typename U, typename V>
  static void Complete(std::shared_ptr<future_shared_state<U>> const& out,
                       future<V> inner) {
    if (!inner.valid()) {
      out->set_exception(MakeFutureError(std::future_errc::broken_promise));
      return;
    }
    Forward(out, std::move(inner.state_));
  }
};

}  // namespace internal

template <typename T>
future<T>::future(future<future<T>>&& rhs)
    : state_(internal::FutureThenImpl::Flatten(rhs)) {}

template <typename T>
template <typename F>
future<internal::UnwrappedType<internal::invoke_result_t<F, future<T>>>>
future<T>::then(F&& functor) {
  return internal::FutureThenImpl::Then(*this, std::forward<F>(functor));
}

/// Returns a satisfied future holding @p value.
template <typename T>
future<typename std::decay<T>::type> make_ready_future(T&& value) {
  promise<typename std::decay<T>::type> p;
  p.set_value(std::forward<T>(value));
  return p.get_future();
}

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_FUTURE_H
