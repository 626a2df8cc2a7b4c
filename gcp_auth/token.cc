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

#include "gcp_auth/token.h"
#include "gcp_auth/internal/make_auth_error.h"
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include <algorithm>
#include <iostream>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace {

bool IsValidHeaderByte(char c) {
  auto const u = static_cast<unsigned char>(c);
  if (u == '\t') return true;
  return u >= 0x20 && u != 0x7F;
}

}  // namespace

StatusOr<Token> Token::Create(std::string access_token,
                              Clock::time_point acquired_at,
                              Clock::time_point expiry) {
  if (access_token.empty()) {
    return internal::InvalidTokenShapeError("the access token is empty",
                                            GCP_AUTH_ERROR_INFO());
  }
  auto i = std::find_if_not(access_token.begin(), access_token.end(),
                            IsValidHeaderByte);
  if (i != access_token.end()) {
    return internal::InvalidTokenShapeError(
        absl::StrCat("the access token contains an invalid byte at offset ",
                     std::distance(access_token.begin(), i)),
        GCP_AUTH_ERROR_INFO());
  }
  return Token(std::move(access_token), acquired_at, expiry);
}

Token::Token(std::string access_token, Clock::time_point acquired_at,
             Clock::time_point expiry)
    : access_token_(std::move(access_token)),
      acquired_at_(acquired_at),
      expiry_(expiry),
      header_("Bearer " + access_token_) {}

absl::optional<Token::Clock::duration> Token::ValidFor(
    Clock::time_point now) const {
  if (expiry_ - now <= kTokenRefreshSkew) return absl::nullopt;
  return expiry_ - now - kTokenRefreshSkew;
}

std::ostream& operator<<(std::ostream& os, Token const& token) {
  auto const& t = token.access_token();
  auto const prefix = t.substr(0, (std::min)(t.size(), std::size_t{4}));
  return os << "Token{access_token=" << prefix << "[censored]"
            << ", acquired_at="
            << absl::FormatTime(absl::FromChrono(token.acquired_at()),
                                absl::UTCTimeZone())
            << ", expiry="
            << absl::FormatTime(absl::FromChrono(token.expiry()),
                                absl::UTCTimeZone())
            << "}";
}

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
