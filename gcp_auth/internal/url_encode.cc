// Copyright 2023 Google LLC
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

#include "gcp_auth/internal/url_encode.h"
#include <cctype>
#include <cstring>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {
namespace {

bool Reserved(unsigned char c) {
  auto constexpr kReserved = " \"#$%&+,/:;<=>?@[\\]^`{|}";
  return c != '\0' && std::strchr(kReserved, c) != nullptr;
}

}  // namespace

std::string UrlEncode(absl::string_view value) {
  auto constexpr kDigits = "0123456789ABCDEF";
  std::string s;
  s.reserve(value.size());
  for (unsigned char c : value) {
    if (Reserved(c) || std::isprint(c) == 0) {
      s.push_back('%');
      s.push_back(kDigits[(c >> 4) & 0xf]);
      s.push_back(kDigits[c & 0xf]);
      continue;
    }
    s.push_back(static_cast<char>(c));
  }
  return s;
}

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
