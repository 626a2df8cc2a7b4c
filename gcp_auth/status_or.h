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

#ifndef GCP_AUTH_STATUS_OR_H
#define GCP_AUTH_STATUS_OR_H

#include "gcp_auth/internal/throw_delegate.h"
#include "gcp_auth/status.h"
#include "gcp_auth/version.h"
#include "absl/types/variant.h"
#include <utility>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN

/**
 * A value of type `T`, or the `Status` explaining why there is none.
 *
 * Test the object (`ok()` or the conversion to `bool`) before using `*` or
 * `->`. `value()` throws `RuntimeStatusError` when there is no value.
 *
 * @code
 * auto token = Token::Create(...);
 * if (!token) return std::move(token).status();
 * request.AddHeader("authorization", token->authorization_header());
 * @endcode
 */
template <typename T>
class StatusOr final {
 public:
  using value_type = T;

  /// An `UNKNOWN` error, so a default constructed object is never "ok".
  StatusOr() : StatusOr(Status(StatusCode::kUnknown, "default")) {}

  /// Holds the error @p status. Throws `std::invalid_argument` if it is OK.
  // NOLINTNEXTLINE(google-explicit-constructor)
  StatusOr(Status status) : v_(std::move(status)) {
    if (absl::get<Status>(v_).ok()) internal::ThrowInvalidArgument(__func__);
  }

  // NOLINTNEXTLINE(google-explicit-constructor)
  StatusOr(T value) : v_(std::move(value)) {}

  bool ok() const { return v_.index() == 1; }
  explicit operator bool() const { return ok(); }

  T& operator*() & { return absl::get<1>(v_); }
  T const& operator*() const& { return absl::get<1>(v_); }
  T&& operator*() && { return absl::get<1>(std::move(v_)); }

  T* operator->() { return &absl::get<1>(v_); }
  T const* operator->() const { return &absl::get<1>(v_); }

  T& value() & { return (CheckValue(), **this); }
  T const& value() const& { return (CheckValue(), **this); }
  T&& value() && { return (CheckValue(), *std::move(*this)); }

  /// The error, or an OK status if this holds a value.
  Status const& status() const& {
    static auto const* const kOk = new Status;
    return ok() ? *kOk : absl::get<0>(v_);
  }
  Status status() && {
    return ok() ? Status{} : absl::get<0>(std::move(v_));
  }

 private:
  void CheckValue() const {
    if (!ok()) internal::ThrowStatus(absl::get<0>(v_));
  }

  absl::variant<Status, T> v_;
};

template <typename T>
bool operator==(StatusOr<T> const& a, StatusOr<T> const& b) {
  if (a.ok() != b.ok()) return false;
  return a.ok() ? *a == *b : a.status() == b.status();
}

template <typename T>
bool operator!=(StatusOr<T> const& a, StatusOr<T> const& b) {
  return !(a == b);
}

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_STATUS_OR_H
