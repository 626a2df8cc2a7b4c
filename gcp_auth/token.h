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

#ifndef GCP_AUTH_TOKEN_H
#define GCP_AUTH_TOKEN_H

#include "gcp_auth/status_or.h"
#include "gcp_auth/version.h"
#include "absl/types/optional.h"
#include <chrono>
#include <iosfwd>
#include <string>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN

/// Tokens are refreshed this long before they expire.
auto constexpr kTokenRefreshSkew = std::chrono::seconds(60);

/**
 * An OAuth2 bearer token and its validity window.
 *
 * The `authorization` header value, `Bearer <token>`, is computed once, when
 * the token is created. Tokens are immutable.
 */
class Token {
 public:
  using Clock = std::chrono::system_clock;

  /**
   * Creates a token, validating that @p access_token can be used in a header.
   *
   * Fails with a `kInvalidTokenShape` error if @p access_token is empty or
   * contains control characters (other than horizontal tab) or DEL.
   */
  static StatusOr<Token> Create(std::string access_token,
                                Clock::time_point acquired_at,
                                Clock::time_point expiry);

  std::string const& access_token() const { return access_token_; }
  Clock::time_point acquired_at() const { return acquired_at_; }
  Clock::time_point expiry() const { return expiry_; }

  /// The value for the `authorization` header.
  std::string const& authorization_header() const { return header_; }

  /**
   * Returns how long the token remains usable, or `absl::nullopt` if it is
   * expired.
   *
   * The token is usable while `now + kTokenRefreshSkew < expiry()`.
   */
  absl::optional<Clock::duration> ValidFor(Clock::time_point now) const;

  bool IsValid(Clock::time_point now) const {
    return ValidFor(now).has_value();
  }

  friend bool operator==(Token const& a, Token const& b) {
    return a.access_token_ == b.access_token_ &&
           a.acquired_at_ == b.acquired_at_ && a.expiry_ == b.expiry_;
  }
  friend bool operator!=(Token const& a, Token const& b) { return !(a == b); }

 private:
  Token(std::string access_token, Clock::time_point acquired_at,
        Clock::time_point expiry);

  std::string access_token_;
  Clock::time_point acquired_at_;
  Clock::time_point expiry_;
  std::string header_;
};

/// Streams a redacted form of @p token, the access token is never printed.
std::ostream& operator<<(std::ostream& os, Token const& token);

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_TOKEN_H
